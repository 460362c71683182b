#include "crosstab.hpp"

#include "test_utils.hpp"

namespace {

void test_counts() {
    std::vector<gene_record> genes = {
        {"g1", "chr1", "A"},
        {"g2", "chr1", "A"},
        {"g3", "chr1", "B"},
        {"g4", "chr2", "A"},
        {"g5", "chr3", "C"},
    };
    crosstab counts(genes);

    CHECK(counts.total_genes() == 5);
    CHECK(counts.alg_count() == 3);
    CHECK(counts.chromosome_count() == 3);

    CHECK(counts.count("chr1", "A") == 2);
    CHECK(counts.count("chr1", "B") == 1);
    CHECK(counts.count("chr2", "A") == 1);
    CHECK(counts.count("chr2", "B") == 0);
    CHECK(counts.count("chrZ", "A") == 0);
    CHECK(counts.count("chr1", "Z") == 0);

    CHECK(counts.alg_total("A") == 3);
    CHECK(counts.alg_total("Z") == 0);
    CHECK(counts.chromosome_total("chr1") == 3);
    CHECK(counts.chromosome_total("chrZ") == 0);

    // only observed pairs are stored
    CHECK(counts.by_alg().at("A").size() == 2);
    CHECK(counts.by_alg().at("C").size() == 1);
}

// duplicate gene IDs count as separate genes
void test_duplicate_genes() {
    std::vector<gene_record> genes = {
        {"g1", "chr1", "A"},
        {"g1", "chr1", "A"},
    };
    crosstab counts(genes);
    CHECK(counts.count("chr1", "A") == 2);
    CHECK(counts.total_genes() == 2);
}

void test_empty() {
    crosstab counts;
    CHECK(counts.empty());
    CHECK(counts.alg_count() == 0);
    CHECK(counts.by_alg().empty());
}

void test_write_tsv() {
    auto dir = rindex_test::make_temp_dir("crosstab");
    crosstab counts;
    counts.add("chr2", "B");
    counts.add("chr1", "A");
    counts.add("chr1", "B");
    counts.add("chr1", "A");

    auto path = dir / "genome.crosstab.tsv";
    counts.write_tsv(path);

    CHECK(rindex_test::read_file(path) ==
          "chromosome\tA\tB\ttotal\n"
          "chr1\t2\t1\t3\n"
          "chr2\t0\t1\t1\n");

    std::filesystem::remove_all(dir);
}

}  // namespace

int main() {
    test_counts();
    test_duplicate_genes();
    test_empty();
    test_write_tsv();

    return rindex_test::report("test_crosstab");
}
