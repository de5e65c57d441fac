#include "common/io_utils.hpp"
#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <utime.h>
#include <chrono>
#include <fstream>
#include <iterator>
#include <system_error>
#include "common/exceptions.hpp"

namespace hjudge {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(const fs::path &path) {
    ifstream fin(path, ios::binary);
    if (!fin) throw internal_error("unable to read file " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(const fs::path &path, const string &def) {
    if (!fs::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

string read_file_prefix(const fs::path &path, size_t limit, bool *truncated) {
    if (truncated) *truncated = false;
    ifstream fin(path, ios::binary);
    if (!fin) return "";
    string buffer(limit, '\0');
    fin.read(buffer.data(), limit);
    buffer.resize(fin.gcount());
    if (truncated && fin.peek() != char_traits<char>::eof())
        *truncated = true;
    return buffer;
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path, ios::binary | ios::trunc);
    if (!fout) throw internal_error("unable to write file " + path.string());
    fout << content;
}

int64_t file_size_or_zero(const fs::path &path) {
    error_code ec;
    auto size = fs::file_size(path, ec);
    return ec ? 0 : static_cast<int64_t>(size);
}

string assert_safe_path(const string &subpath) {
    if (subpath.empty() || subpath.find("..") != string::npos || subpath.front() == '/')
        throw internal_error("subpath is not safe " + subpath);
    return subpath;
}

scoped_file_lock::scoped_file_lock() = default;

scoped_file_lock::scoped_file_lock(const fs::path &path, bool shared) : lock_file(path) {
    fd = open(path.c_str(), O_CREAT | O_RDWR, 0644);
    if (fd < 0)
        throw system_error(errno, system_category(), "unable to open lock file " + path.string());
    if (flock(fd, shared ? LOCK_SH : LOCK_EX) < 0) {
        int err = errno;
        close(fd);
        throw system_error(err, system_category(), "unable to lock " + path.string());
    }
    valid = true;
}

scoped_file_lock::scoped_file_lock(scoped_file_lock &&lock) noexcept {
    *this = move(lock);
}

scoped_file_lock::~scoped_file_lock() {
    release();
}

scoped_file_lock &scoped_file_lock::operator=(scoped_file_lock &&lock) noexcept {
    swap(fd, lock.fd);
    swap(valid, lock.valid);
    swap(lock_file, lock.lock_file);
    return *this;
}

fs::path scoped_file_lock::file() const {
    return lock_file;
}

void scoped_file_lock::release() {
    if (!valid) return;
    flock(fd, LOCK_UN);
    close(fd);
    valid = false;
}

scoped_file_lock lock_directory(const fs::path &dir, bool shared) {
    fs::create_directories(dir);
    fs::path lock_file = dir / ".lock";
    if (fs::is_directory(lock_file))
        fs::remove_all(lock_file);
    return scoped_file_lock(lock_file, shared);
}

time_t last_write_time(const fs::path &path) {
    struct stat attr;
    if (stat(path.c_str(), &attr) != 0)
        throw system_error(errno, system_category(), "error when reading modification time of path " + path.string());
    return attr.st_mtim.tv_sec;
}

void last_write_time(const fs::path &path, time_t timestamp) {
    struct utimbuf buf;
    buf.actime = chrono::system_clock::to_time_t(chrono::system_clock::now());
    buf.modtime = timestamp;
    if (utime(path.c_str(), &buf) == -1)
        throw system_error(errno, system_category(), "error when setting modification time of path " + path.string());
}

}  // namespace hjudge
