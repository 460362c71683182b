#include "genome_manifest.hpp"
#include "errors.hpp"

#include "test_utils.hpp"

using rindex_test::row;
using rindex_test::write_file;

namespace {

void test_directory_scan() {
    auto dir = rindex_test::make_temp_dir("manifest_scan");
    write_file(dir / "Owenia_coordinates.tsv", row("g1", "chr1", "A"));
    write_file(dir / "Capitella_coordinates.tsv", row("g1", "chr1", "A"));
    rindex_test::write_gzip_file(dir / "Platynereis.tsv.gz", row("g1", "chr1", "A"));
    write_file(dir / "notes.txt", "not a genome\n");
    write_file(dir / "archive.tsv.bak", "not a genome\n");
    std::filesystem::create_directories(dir / "nested.tsv");

    auto manifest = genome_manifest::from_directory(dir);
    CHECK(manifest.size() == 3);

    // sorted by species label, labelled with the file name
    CHECK(manifest[0].species == "Capitella_coordinates.tsv");
    CHECK(manifest[1].species == "Owenia_coordinates.tsv");
    CHECK(manifest[2].species == "Platynereis.tsv.gz");
    CHECK(manifest[2].source_file == dir / "Platynereis.tsv.gz");

    std::filesystem::remove_all(dir);
}

void test_is_eligible() {
    CHECK(genome_manifest::is_eligible("a.tsv"));
    CHECK(genome_manifest::is_eligible("/x/y/a.tsv.gz"));
    CHECK(!genome_manifest::is_eligible("a.csv"));
    CHECK(!genome_manifest::is_eligible("a.tsv.bak"));
    CHECK(!genome_manifest::is_eligible("a.gz"));
}

template<typename Fn>
bool throws_input_directory_error(Fn fn) {
    try {
        fn();
    } catch (const input_directory_error&) {
        return true;
    }
    return false;
}

void test_directory_errors() {
    CHECK(throws_input_directory_error([] {
        genome_manifest::from_directory("/nonexistent/rindex/input");
    }));

    auto dir = rindex_test::make_temp_dir("manifest_errors");
    write_file(dir / "file.tsv", row("g1", "chr1", "A"));
    CHECK(throws_input_directory_error([&] {
        genome_manifest::from_directory(dir / "file.tsv");
    }));

    auto empty = dir / "empty";
    std::filesystem::create_directories(empty);
    write_file(empty / "readme.md", "nothing here\n");
    CHECK(throws_input_directory_error([&] {
        genome_manifest::from_directory(empty);
    }));

    std::filesystem::remove_all(dir);
}

void test_manifest_file() {
    auto dir = rindex_test::make_temp_dir("manifest_file");
    std::filesystem::create_directories(dir / "data");
    write_file(dir / "data" / "owenia.tsv", row("g1", "chr1", "A"));
    write_file(dir / "data" / "capitella.tsv", row("g1", "chr1", "A"));

    auto manifest_path = dir / "genomes.tsv";
    write_file(manifest_path,
        "species\tfile\n"
        "# annelids\n"
        "Owenia fusiformis\tdata/owenia.tsv\n"
        "Capitella teleta\t" + (dir / "data" / "capitella.tsv").string() + "\n");

    auto manifest = genome_manifest::from_file(manifest_path);
    CHECK(manifest.size() == 2);
    CHECK(manifest[0].species == "Capitella teleta");
    CHECK(manifest[1].species == "Owenia fusiformis");
    CHECK(std::filesystem::equivalent(manifest[1].source_file, dir / "data" / "owenia.tsv"));

    std::filesystem::remove_all(dir);
}

void test_manifest_errors() {
    auto dir = rindex_test::make_temp_dir("manifest_file_errors");
    write_file(dir / "a.tsv", row("g1", "chr1", "A"));
    auto manifest_path = dir / "genomes.tsv";

    // duplicate species
    write_file(manifest_path, "sp\ta.tsv\nsp\ta.tsv\n");
    CHECK(throws_input_directory_error([&] { genome_manifest::from_file(manifest_path); }));

    // missing genome file
    write_file(manifest_path, "sp\tmissing.tsv\n");
    CHECK(throws_input_directory_error([&] { genome_manifest::from_file(manifest_path); }));

    // header only
    write_file(manifest_path, "species\tfile\n");
    CHECK(throws_input_directory_error([&] { genome_manifest::from_file(manifest_path); }));

    // short row
    write_file(manifest_path, "sp\ta.tsv\nlonely\n");
    bool thrown = false;
    try {
        genome_manifest::from_file(manifest_path);
    } catch (const malformed_input_error& e) {
        thrown = true;
        CHECK(e.line() == 2);
    }
    CHECK(thrown);

    // labels name output files, so no path separators
    for (const char* label : {"clade/sp", "../escape", ".."}) {
        write_file(manifest_path, "sp\ta.tsv\n" + std::string(label) + "\ta.tsv\n");
        thrown = false;
        try {
            genome_manifest::from_file(manifest_path);
        } catch (const malformed_input_error& e) {
            thrown = true;
            CHECK(e.line() == 2);
        }
        CHECK(thrown);
    }

    std::filesystem::remove_all(dir);
}

}  // namespace

int main() {
    test_directory_scan();
    test_is_eligible();
    test_directory_errors();
    test_manifest_file();
    test_manifest_errors();

    return rindex_test::report("test_genome_manifest");
}
