#include "coordinates_reader.hpp"
#include "errors.hpp"
#include "genome_table.hpp"

#include "test_utils.hpp"

using rindex_test::row;
using rindex_test::write_file;

namespace {

void test_read_rows() {
    auto dir = rindex_test::make_temp_dir("reader_rows");
    auto path = dir / "species.tsv";
    write_file(path,
        "1\tComplete\tCAIIXF020000008.1\t36937317\t36938462\tA1b\n"
        "2\tComplete\tCAIIXF020000005.1\t32633780\t32633985\tEb\n"
        "3\tDuplicated\tCAIIXF020000001.1\t61230213\t61230325\tP\n");

    coordinates_reader reader(path);
    gene_record entry;

    CHECK(reader.read_next(entry));
    CHECK(entry.gene_id == "1");
    CHECK(entry.status == "Complete");
    CHECK(entry.chromosome == "CAIIXF020000008.1");
    CHECK(entry.start == "36937317");
    CHECK(entry.end == "36938462");
    CHECK(entry.alg == "A1b");
    CHECK(reader.get_current_line() == 1);

    CHECK(reader.read_next(entry));
    CHECK(entry.alg == "Eb");
    CHECK(reader.read_next(entry));
    CHECK(entry.status == "Duplicated");
    CHECK(entry.alg == "P");
    CHECK(!reader.read_next(entry));
    CHECK(!reader.has_next());

    std::filesystem::remove_all(dir);
}

// blank lines, comments, CRLF endings, extra columns, no final newline
void test_lenient_layout() {
    auto dir = rindex_test::make_temp_dir("reader_layout");
    auto path = dir / "species.tsv";
    write_file(path,
        "# comment\n"
        "\n"
        "g1\tComplete\tchr1\t1\t2\tA\r\n"
        "g2\tComplete\tchr2\t3\t4\tB\textra\n"
        "g3\tComplete\tchr3\t5\t6\tC");

    genome_table genome = genome_loader::load({"species.tsv", path});
    CHECK(genome.size() == 3);
    CHECK(genome.species == "species.tsv");
    CHECK(genome.genes[0].alg == "A");
    CHECK(genome.genes[1].alg == "B");
    CHECK(genome.genes[2].chromosome == "chr3");
    CHECK(genome.genes[2].alg == "C");

    std::filesystem::remove_all(dir);
}

void test_gzip() {
    auto dir = rindex_test::make_temp_dir("reader_gzip");
    auto path = dir / "species.tsv.gz";
    std::string content;
    for (int i = 0; i < 1000; ++i) {
        content += row("g" + std::to_string(i), "chr" + std::to_string(i % 7),
                       i % 2 ? "A" : "B");
    }
    rindex_test::write_gzip_file(path, content);

    genome_table genome = genome_loader::load({"species.tsv.gz", path});
    CHECK(genome.size() == 1000);
    CHECK(genome.genes[999].gene_id == "g999");
    CHECK(genome.genes[999].alg == "A");

    std::filesystem::remove_all(dir);
}

// a line longer than the read buffer
void test_long_line() {
    auto dir = rindex_test::make_temp_dir("reader_long");
    auto path = dir / "species.tsv";
    std::string long_id(10000, 'x');
    write_file(path, row(long_id, "chr1", "A") + row("g2", "chr1", "B"));

    genome_table genome = genome_loader::load({"species.tsv", path});
    CHECK(genome.size() == 2);
    CHECK(genome.genes[0].gene_id == long_id);
    CHECK(genome.genes[0].alg == "A");
    CHECK(genome.genes[1].alg == "B");

    std::filesystem::remove_all(dir);
}

void expect_malformed(const std::string& content, size_t line) {
    auto dir = rindex_test::make_temp_dir("reader_malformed");
    auto path = dir / "bad.tsv";
    write_file(path, content);

    bool thrown = false;
    try {
        genome_loader::load({"bad.tsv", path});
    } catch (const malformed_input_error& e) {
        thrown = true;
        CHECK(e.line() == line);
        CHECK(e.file() == path);
        CHECK(std::string(e.what()).find("bad.tsv") != std::string::npos);
    }
    CHECK(thrown);

    std::filesystem::remove_all(dir);
}

void test_malformed() {
    // too few fields
    expect_malformed(row("g1", "chr1", "A") + "g2\tComplete\tchr1\t1\t2\n", 2);
    // blank ALG
    expect_malformed(row("g1", "chr1", ""), 1);
    // blank chromosome
    expect_malformed("\n" + row("g1", "", "A"), 2);
    // blank gene ID
    expect_malformed(row("", "chr1", "A"), 1);
}

void test_aliases_applied() {
    auto dir = rindex_test::make_temp_dir("reader_alias");
    auto path = dir / "species.tsv";
    write_file(path, row("g1", "chr1", "A1a") + row("g2", "chr1", "A1b") +
                     row("g3", "chr2", "Qc") + row("g4", "chr2", "B1"));

    genome_table genome = genome_loader::load({"species.tsv", path},
                                              alg_map::bilaterian_subgroups());
    CHECK(genome.genes[0].alg == "A1");
    CHECK(genome.genes[1].alg == "A1");
    CHECK(genome.genes[2].alg == "Q");
    CHECK(genome.genes[3].alg == "B1");

    std::filesystem::remove_all(dir);
}

void test_empty_file() {
    auto dir = rindex_test::make_temp_dir("reader_empty");
    auto path = dir / "empty.tsv";
    write_file(path, "");

    genome_table genome = genome_loader::load({"empty.tsv", path});
    CHECK(genome.empty());

    std::filesystem::remove_all(dir);
}

void test_missing_file() {
    bool thrown = false;
    try {
        coordinates_reader reader("/nonexistent/rindex/species.tsv");
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    CHECK(thrown);
}

}  // namespace

int main() {
    test_read_rows();
    test_lenient_layout();
    test_gzip();
    test_long_line();
    test_malformed();
    test_aliases_applied();
    test_empty_file();
    test_missing_file();

    return rindex_test::report("test_coordinates_reader");
}
