#include "common/io_utils.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <unistd.h>
#include <algorithm>
#include <fstream>
#include <system_error>

namespace arbiter {
using namespace std;
namespace fs = std::filesystem;

static const size_t CROP_MAX_LINES = 10;
static const size_t CROP_KEPT_LINES = 8;
static const size_t CROP_MAX_CHARS = 1000;

string read_file_content(filesystem::path const &path) {
    ifstream fin(path.string(), ios::binary);
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(filesystem::path const &path, const string &def) {
    if (!filesystem::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

bool utf8_check_is_valid(const string &string) {
    int c, i, ix, n, j;
    for (i = 0, ix = string.length(); i < ix; i++) {
        c = (unsigned char)string[i];
        if (0x00 <= c && c <= 0x7f)
            n = 0;  // 0bbbbbbb
        else if ((c & 0xE0) == 0xC0)
            n = 1;  // 110bbbbb
        else if (c == 0xed && i < (ix - 1) && ((unsigned char)string[i + 1] & 0xa0) == 0xa0)
            return false;  //U+d800 to U+dfff
        else if ((c & 0xF0) == 0xE0)
            n = 2;  // 1110bbbb
        else if ((c & 0xF8) == 0xF0)
            n = 3;  // 11110bbb
        else
            return false;
        for (j = 0; j < n && i < ix; j++) {  // n bytes matching 10bbbbbb follow ?
            if ((++i == ix) || (((unsigned char)string[i] & 0xC0) != 0x80))
                return false;
        }
    }
    return true;
}

void clear_directory(const fs::path &dir) {
    fs::create_directories(dir);
    for (auto &entry : fs::directory_iterator(dir))
        fs::remove_all(entry.path());
}

string crop_output(const string &output) {
    size_t numlines = count(output.begin(), output.end(), '\n') + 1;
    string result = output;
    bool cropped = false;

    if (numlines > CROP_MAX_LINES) {
        size_t pos = 0;
        for (size_t i = 0; i < CROP_KEPT_LINES; ++i)
            pos = result.find('\n', pos) + 1;
        result.resize(pos);
        cropped = true;
    }

    if (result.size() > CROP_MAX_CHARS) {
        result.resize(CROP_MAX_CHARS);
        result += " ...\n";
        cropped = true;
    }

    if (cropped) {
        if (!result.empty() && result.back() != '\n') result += '\n';
        if (numlines > CROP_MAX_LINES)
            result += fmt::format("[... {} more lines]", numlines - CROP_KEPT_LINES);
        else
            result += "[...]";
    }
    return result;
}

string format_data(const string &data) {
    if (data.empty()) return "";
    string text = data;
    while (!text.empty() && text.back() == '\n') text.pop_back();
    const char *prefix = count(text.begin(), text.end(), '\n') == 0 ? "  " : "\n";
    return prefix + text;
}

scoped_fd::scoped_fd() : fd(-1) {}

scoped_fd::scoped_fd(int fd) : fd(fd) {}

scoped_fd::scoped_fd(scoped_fd &&other) : fd(-1) {
    *this = move(other);
}

scoped_fd::~scoped_fd() {
    reset();
}

scoped_fd &scoped_fd::operator=(scoped_fd &&other) {
    swap(fd, other.fd);
    return *this;
}

int scoped_fd::get() const {
    return fd;
}

bool scoped_fd::valid() const {
    return fd >= 0;
}

void scoped_fd::reset() {
    if (fd < 0) return;
    close(fd);
    fd = -1;
}

void make_pipe(scoped_fd &read_end, scoped_fd &write_end) {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0)
        throw system_error(errno, system_category(), "creating pipe");
    read_end = scoped_fd(fds[0]);
    write_end = scoped_fd(fds[1]);
}

}  // namespace arbiter
