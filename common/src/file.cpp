#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include "shroud/common/file.h"
#include "shroud/common/utils.h"

namespace shroud::file {

bool is_valid(Handle f) {
    return f >= 0;
}

Handle open(const std::string &path, int flags) {
    return ::open(path.c_str(), flags | O_CLOEXEC, 0666);
}

void close(Handle f) {
    if (is_valid(f)) {
        ::close(f);
    }
}

ssize_t read(Handle f, char *buf, size_t size) {
    return ::read(f, buf, size);
}

ssize_t write(Handle f, const void *buf, size_t size) {
    return ::write(f, buf, size);
}

ssize_t get_size(Handle f) {
    struct stat st {};
    return (0 == fstat(f, &st)) ? st.st_size : -1;
}

std::optional<time_t> get_modification_time(const std::string &path) {
    struct stat st {};
    if (0 != stat(path.c_str(), &st)) {
        return std::nullopt;
    }
    return st.st_mtime;
}

std::optional<std::string> read_all(Handle f) {
    static constexpr size_t CHUNK_SIZE = 64 * 1024;

    ssize_t file_size = get_size(f);
    if (file_size < 0) {
        return std::nullopt;
    }

    std::string content;
    content.reserve(file_size);
    char buffer[CHUNK_SIZE];
    ssize_t r;
    while (0 < (r = read(f, buffer, sizeof(buffer)))) {
        content.append(buffer, r);
    }
    if (r < 0) {
        return std::nullopt;
    }
    return content;
}

size_t for_each_line(std::string_view data, const LineAction &action) {
    size_t visited = 0;
    size_t from = 0;
    while (from < data.size()) {
        size_t end = data.find_first_of("\r\n", from);
        if (end == std::string_view::npos) {
            end = data.size();
        }
        std::string_view line = utils::trim(data.substr(from, end - from));
        ++visited;
        if (!action(from, line)) {
            break;
        }
        from = end + 1;
        if (end < data.size() && data[end] == '\r' && from < data.size() && data[from] == '\n') {
            ++from;
        }
    }
    return visited;
}

} // namespace shroud::file
