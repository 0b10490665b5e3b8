#include "dlkeeper/partial_file.h"
#include "test_support.h"
#include <iostream>
#include <cassert>
#include <filesystem>

using namespace dlkeeper;
using namespace dlkeeper::test;

void test_unique_destination_numbering() {
    TempDir dir;

    assert(unique_destination(dir.path(), "report.pdf") == dir.file("report.pdf"));

    write_file(dir.file("report.pdf"), "a");
    write_file(dir.file("report.(1).pdf"), "b");
    assert(unique_destination(dir.path(), "report.pdf") == dir.file("report.(2).pdf"));

    // Only the last extension is split off
    write_file(dir.file("archive.tar.gz"), "c");
    assert(unique_destination(dir.path(), "archive.tar.gz") == dir.file("archive.tar.(1).gz"));

    std::cout << "test_unique_destination_numbering passed!" << std::endl;
}

void test_unique_destination_without_extension() {
    TempDir dir;
    write_file(dir.file("README"), "x");
    assert(unique_destination(dir.path(), "README") == dir.file("README.(1)"));

    std::cout << "test_unique_destination_without_extension passed!" << std::endl;
}

void test_unique_destination_fallback() {
    TempDir dir;
    write_file(dir.file("data.bin"), "x");
    write_file(dir.file("data.(1).bin"), "x");

    std::string chosen = unique_destination(dir.path(), "data.bin", 2);
    std::string name = file_name_of(chosen);
    assert(name != "data.bin");
    assert(name != "data.(1).bin");
    assert(name.compare(0, 5, "data.") == 0);
    assert(name.size() > 9 && name.substr(name.size() - 4) == ".bin");
    assert(!std::filesystem::exists(chosen));

    std::cout << "test_unique_destination_fallback passed!" << std::endl;
}

void test_backup_and_restore() {
    TempDir dir;
    std::string dest = dir.file("movie.mp4");
    write_file(dest, std::string(50, 'm'));

    assert(backup_path_for(dest) == dest + ".part");
    assert(backup_partial(dest));
    assert(read_file(dest + ".part") == std::string(50, 'm'));

    // Backing up again replaces the old copy
    write_file(dest, std::string(70, 'n'));
    assert(backup_partial(dest));
    assert(read_file(dest + ".part").size() == 70);

    // Destination still there: nothing to do
    std::string error;
    assert(restore_partial(dest, error));
    assert(std::filesystem::exists(dest + ".part"));

    std::filesystem::remove(dest);
    assert(restore_partial(dest, error));
    assert(error.empty());
    assert(read_file(dest).size() == 70);
    assert(!std::filesystem::exists(dest + ".part"));

    // No backup at all is not an error either
    std::filesystem::remove(dest);
    assert(restore_partial(dest, error));
    assert(!std::filesystem::exists(dest));

    std::cout << "test_backup_and_restore passed!" << std::endl;
}

void test_backup_of_missing_file() {
    TempDir dir;
    assert(!backup_partial(dir.file("never-written.zip")));
    assert(!std::filesystem::exists(dir.file("never-written.zip.part")));

    std::cout << "test_backup_of_missing_file passed!" << std::endl;
}

void test_discard_and_size() {
    TempDir dir;
    std::string dest = dir.file("song.ogg");
    write_file(dest, std::string(12, 's'));
    assert(backup_partial(dest));

    assert(existing_file_size(dest) == std::optional<uint64_t>(12));
    assert(!existing_file_size(dir.file("absent.ogg")));

    assert(discard_partial(dest));
    assert(!std::filesystem::exists(dest + ".part"));
    assert(!discard_partial(dest));
    assert(std::filesystem::exists(dest));

    std::cout << "test_discard_and_size passed!" << std::endl;
}

void test_filename_from_url() {
    assert(filename_from_url("https://example.com/files/report.pdf") == "report.pdf");
    assert(filename_from_url("https://example.com/files/report.pdf?token=abc#page=2") == "report.pdf");
    assert(filename_from_url("https://example.com/a/my%20file.txt") == "my file.txt");
    assert(filename_from_url("https://example.com/") == "download");
    assert(filename_from_url("https://example.com") == "download");
    assert(filename_from_url("https://example.com/dir/") == "download");
    assert(filename_from_url("https://example.com/..") == "download");
    assert(filename_from_url("https://example.com/x%2F..%2Fetc") == "download");
    assert(filename_from_url("https://example.com/bad%zzname") == "bad%zzname");

    assert(file_name_of("/tmp/downloads/report.pdf") == "report.pdf");

    std::cout << "test_filename_from_url passed!" << std::endl;
}

int main() {
    try {
        test_unique_destination_numbering();
        test_unique_destination_without_extension();
        test_unique_destination_fallback();
        test_backup_and_restore();
        test_backup_of_missing_file();
        test_discard_and_size();
        test_filename_from_url();
        std::cout << "All tests passed!" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
