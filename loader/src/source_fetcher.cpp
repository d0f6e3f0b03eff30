#include <cerrno>
#include <cstring>

#include "shroud/common/file.h"
#include "shroud/common/utils.h"
#include "shroud/loader/source_fetcher.h"

namespace shroud::dns {

static constexpr std::string_view FILE_SCHEME = "file://";

Result<FetchedSource, LoaderError> LocalSourceFetcher::fetch(const SourceConfig &source) {
    if (source.in_memory) {
        return FetchedSource{.content = source.origin};
    }

    std::string_view origin = source.origin;
    if (utils::starts_with(origin, FILE_SCHEME)) {
        origin.remove_prefix(FILE_SCHEME.size());
    } else if (origin.find("://") != std::string_view::npos) {
        return make_error(LoaderError::AE_UNSUPPORTED_ORIGIN, std::string{origin.substr(0, origin.find("://"))});
    }

    std::string path{origin};
    file::Handle f = file::open(path, file::RDONLY);
    if (!file::is_valid(f)) {
        int err = errno;
        dbglog(m_log, "{}: failed to open file: {}", source.name, strerror(err));
        return make_error(LoaderError::AE_FETCH_FAILED, SHROUD_FMT("open: {}", strerror(err)));
    }
    utils::ScopeExit close_file([f] {
        file::close(f);
    });

    std::optional<std::string> content = file::read_all(f);
    if (!content.has_value()) {
        int err = errno;
        return make_error(LoaderError::AE_FETCH_FAILED, SHROUD_FMT("read: {}", strerror(err)));
    }

    FetchedSource fetched{.content = std::move(*content)};
    if (auto mtime = file::get_modification_time(path); mtime.has_value()) {
        fetched.modified_at = SystemClock::from_time_t(*mtime);
    }
    return fetched;
}

} // namespace shroud::dns
