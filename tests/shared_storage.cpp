#include "lantern/storage/FileLocks.hpp"
#include "lantern/storage/SharedDirectory.hpp"
#include "test_support.hpp"

#include <cassert>
#include <chrono>
#include <future>
#include <string>
#include <thread>

using namespace lantern;
using namespace std::chrono_literals;
using storage::LockMode;

namespace {

void test_sanitize() {
    assert(storage::sanitize_filename("notes.txt") == "notes.txt");
    assert(storage::sanitize_filename("../../etc/passwd") == "passwd");
    assert(storage::sanitize_filename("/abs/path/file.bin") == "file.bin");
    assert(storage::sanitize_filename("C:\\Users\\x\\report.pdf") == "report.pdf");
    assert(storage::sanitize_filename("dir/") == "upload");
    assert(storage::sanitize_filename("") == "upload");
    assert(storage::sanitize_filename(".") == "upload");
    assert(storage::sanitize_filename("..") == "upload");
    assert(storage::sanitize_filename("a/..") == "upload");
    assert(storage::sanitize_filename(std::string("bad\0name.txt", 12)) == "badname.txt");
    assert(storage::sanitize_filename("CON") == "upload");
    assert(storage::sanitize_filename("nul.txt") == "upload");
    assert(storage::sanitize_filename("com1") == "upload");
    assert(storage::sanitize_filename("LPT9.log") == "upload");
    assert(storage::sanitize_filename("COM0") == "COM0");
    assert(storage::sanitize_filename("console.txt") == "console.txt");
    assert(storage::sanitize_filename(".hidden") == ".hidden");
}

void test_shared_directory() {
    test::TempDir dir("shared");
    const storage::SharedDirectory shared(dir / "files");
    assert(shared.list().empty());
    assert(std::filesystem::is_directory(dir / "files"));

    test::write_file(shared.resolve("b.txt"), "bbb");
    test::write_file(shared.resolve("a.txt"), "a");
    test::write_file(shared.resolve("bad<SEP>name"), "x");
    std::filesystem::create_directory(shared.resolve("subdir"));

    const auto files = shared.list();
    assert(files.size() == 2);
    assert(files[0].name == "a.txt" && files[0].size == 1);
    assert(files[1].name == "b.txt" && files[1].size == 3);

    assert(shared.file_size("b.txt") == std::optional<std::uint64_t>(3));
    assert(!shared.file_size("missing.txt"));
    assert(!shared.file_size("subdir"));

    assert(shared.remove("a.txt").status == storage::RemoveStatus::Removed);
    assert(!std::filesystem::exists(shared.resolve("a.txt")));
    assert(shared.remove("a.txt").status == storage::RemoveStatus::NotFound);
    assert(shared.remove("subdir").status == storage::RemoveStatus::NotFound);
}

void test_staged_writes() {
    test::TempDir dir("staging");
    const auto target = dir / "report.pdf";
    const auto staged = storage::staging_path_for(target);
    assert(staged.parent_path() == dir.path());
    const auto staged_name = staged.filename().string();
    assert(staged_name.starts_with(".report.pdf."));
    assert(storage::is_staging_name(staged_name));
    assert(!storage::is_staging_name("report.pdf"));
    assert(!storage::is_staging_name(".hidden"));
    assert(!storage::is_staging_name(std::string(storage::kStagingSuffix)));
    assert(storage::sanitize_filename(staged_name) == "upload");
    assert(storage::sanitize_filename("../" + staged_name) == "upload");
    assert(staged != storage::staging_path_for(target));

    test::write_file(target, "old");
    test::write_file(staged, "new contents");
    const storage::SharedDirectory shared(dir.path());
    const auto files = shared.list();
    assert(files.size() == 1 && files[0].name == "report.pdf" && files[0].size == 3);
    assert(!shared.file_size(staged_name));
    assert(shared.remove(staged_name).status == storage::RemoveStatus::NotFound);
    assert(std::filesystem::exists(staged));

    std::error_code ec;
    assert(storage::commit_staged(staged, target, ec) && !ec);
    assert(test::read_file(target) == "new contents");
    assert(!std::filesystem::exists(staged));

    // A failed commit removes the staging file and reports why.
    const auto orphan = storage::staging_path_for(dir / "missing_dir" / "x.bin");
    assert(!storage::commit_staged(orphan, dir / "elsewhere" / "x.bin", ec));
    assert(ec);
}

void test_shared_locks_coexist() {
    storage::FileLockTable locks;
    auto first = locks.acquire("a.txt", LockMode::Shared, 100ms);
    auto second = locks.acquire("a.txt", LockMode::Shared, 100ms);
    assert(first && second);
    assert(locks.tracked() == 1);
    assert(!locks.acquire("a.txt", LockMode::Exclusive, 50ms));

    // Different names never contend.
    assert(locks.acquire("b.txt", LockMode::Exclusive, 50ms));

    first->release();
    second.reset();
    assert(locks.tracked() == 0);
    assert(locks.acquire("a.txt", LockMode::Exclusive, 50ms));
}

void test_exclusive_lock_blocks_until_released() {
    storage::FileLockTable locks;
    auto writer = locks.acquire("upload.bin", LockMode::Exclusive, 100ms);
    assert(writer && writer->mode() == LockMode::Exclusive);
    assert(!locks.acquire("upload.bin", LockMode::Shared, 50ms));

    auto waiter = std::async(std::launch::async, [&locks]() {
        auto lease = locks.acquire("upload.bin", LockMode::Shared, 5s);
        return lease.has_value();
    });
    std::this_thread::sleep_for(100ms);
    writer.reset();
    assert(waiter.get());
    assert(locks.tracked() == 0);
}

void test_lease_moves() {
    storage::FileLockTable locks;
    auto lease = locks.acquire("m.txt", LockMode::Exclusive, 50ms);
    assert(lease);
    storage::FileLockTable::Lease moved = std::move(*lease);
    lease.reset();
    assert(locks.tracked() == 1);
    assert(!locks.acquire("m.txt", LockMode::Exclusive, 20ms));
    moved.release();
    moved.release();
    assert(locks.tracked() == 0);
}

}  // namespace

int main() {
    test_sanitize();
    test_shared_directory();
    test_staged_writes();
    test_shared_locks_coexist();
    test_exclusive_lock_blocks_until_released();
    test_lease_moves();
    return 0;
}
