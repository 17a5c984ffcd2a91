#include <catch2/catch.hpp>
#include "file_lock.hpp"
#include <chrono>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

using namespace cronreg;
using std::chrono::milliseconds;

static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "cronreg_lock_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

// Non-blocking probe through a separate open file description
static bool can_lock(const std::string& path) {
    int fd = open(path.c_str(), O_RDWR);
    if (fd < 0) return false;
    bool ok = flock(fd, LOCK_EX | LOCK_NB) == 0;
    if (ok) flock(fd, LOCK_UN);
    close(fd);
    return ok;
}

TEST_CASE("FileLock: held for the lifetime of the guard", "[lock]") {
    auto dir = make_temp_dir();
    std::string path = dir + "/cronreg.lock";

    {
        FileLock lock(path, milliseconds(0));
        REQUIRE(lock.path() == path);
        REQUIRE(std::filesystem::exists(path));
        REQUIRE_FALSE(can_lock(path));
    }
    REQUIRE(can_lock(path));

    std::filesystem::remove_all(dir);
}

TEST_CASE("FileLock: released when unwinding", "[lock]") {
    auto dir = make_temp_dir();
    std::string path = dir + "/cronreg.lock";

    try {
        FileLock lock(path, milliseconds(0));
        throw std::runtime_error("boom");
    } catch (const std::runtime_error&) {
    }
    REQUIRE(can_lock(path));

    std::filesystem::remove_all(dir);
}

TEST_CASE("FileLock: creates a private parent directory", "[lock]") {
    auto dir = make_temp_dir();
    std::string path = dir + "/state/cronreg.lock";

    {
        FileLock lock(path, milliseconds(0));
    }
    struct stat st {};
    REQUIRE(stat((dir + "/state").c_str(), &st) == 0);
    REQUIRE((st.st_mode & 0777) == 0700);

    struct stat lst {};
    REQUIRE(stat(path.c_str(), &lst) == 0);
    REQUIRE((lst.st_mode & 0077) == 0);

    std::filesystem::remove_all(dir);
}

TEST_CASE("FileLock: contended lock times out instead of hanging", "[lock]") {
    auto dir = make_temp_dir();
    std::string path = dir + "/cronreg.lock";

    int holder = open(path.c_str(), O_CREAT | O_RDWR, 0600);
    REQUIRE(holder >= 0);
    REQUIRE(flock(holder, LOCK_EX | LOCK_NB) == 0);

    auto start = std::chrono::steady_clock::now();
    REQUIRE_THROWS_AS(FileLock(path, milliseconds(200)), LockTimeout);
    auto waited = std::chrono::steady_clock::now() - start;
    REQUIRE(waited >= milliseconds(200));
    REQUIRE(waited < std::chrono::seconds(10));

    flock(holder, LOCK_UN);
    close(holder);

    // Free again: acquired immediately
    FileLock lock(path, milliseconds(0));
    REQUIRE(lock.path() == path);

    std::filesystem::remove_all(dir);
}

TEST_CASE("FileLock: symlinked lock file is refused", "[lock]") {
    auto dir = make_temp_dir();
    std::string target = dir + "/target";
    std::string path = dir + "/cronreg.lock";
    {
        std::ofstream f(target);
    }
    std::filesystem::create_symlink(target, path);

    REQUIRE_THROWS_AS(FileLock(path, milliseconds(0)), std::runtime_error);

    std::filesystem::remove_all(dir);
}

TEST_CASE("FileLock: unopenable path throws", "[lock]") {
    auto dir = make_temp_dir();
    {
        std::ofstream blocker(dir + "/file");
    }
    REQUIRE_THROWS_AS(FileLock(dir + "/file/cronreg.lock", milliseconds(0)),
                      std::runtime_error);

    std::filesystem::remove_all(dir);
}
