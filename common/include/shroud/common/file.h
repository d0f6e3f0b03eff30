#pragma once

#include <cstdint>
#include <ctime>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include <fcntl.h>

namespace shroud::file {

using Handle = int;
static constexpr Handle INVALID_HANDLE = -1;

enum Flags {
    RDONLY = O_RDONLY,
    WRONLY = O_WRONLY,
    RDWR = O_RDWR,
    CREAT = O_CREAT,
    TRUNC = O_TRUNC,
};

/**
 * Check if file handle is valid
 */
bool is_valid(Handle f);

/**
 * Open file by path
 * @param path path to the file
 * @param flags see `Flags`
 * @return file handle, `INVALID_HANDLE` on failure
 */
Handle open(const std::string &path, int flags);

/**
 * Close file handle
 */
void close(Handle f);

/**
 * Read data from file
 * @return number of bytes read, -1 on error
 */
ssize_t read(Handle f, char *buf, size_t size);

/**
 * Write data to file
 * @return number of bytes written, -1 on error
 */
ssize_t write(Handle f, const void *buf, size_t size);

/**
 * Get file size
 * @return file size, -1 on error
 */
ssize_t get_size(Handle f);

/**
 * Get time of the last content modification
 * @return seconds since epoch, or nullopt on error
 */
std::optional<time_t> get_modification_time(const std::string &path);

/**
 * Read the whole file content
 * @return content, or nullopt on error
 */
std::optional<std::string> read_all(Handle f);

/**
 * Line callback
 * @param pos line offset in the data
 * @param line trimmed line
 * @return true to continue, false to stop
 */
using LineAction = std::function<bool(size_t pos, std::string_view line)>;

/**
 * Call the action for every line of the data (LF or CRLF separated)
 * @return number of visited lines
 */
size_t for_each_line(std::string_view data, const LineAction &action);

} // namespace shroud::file
