#pragma once

#include <memory>
#include <optional>
#include <string>

#include "shroud/common/logger.h"
#include "shroud/loader/source.h"

namespace shroud::dns {

struct FetchedSource {
    std::string content;
    /** Modification time of the content if the origin reports it */
    std::optional<SystemClock::time_point> modified_at;
};

/**
 * Retrieves the raw content of a source
 */
class SourceFetcher {
public:
    virtual ~SourceFetcher() = default;

    /**
     * Fetch the source content.
     * `AE_FETCH_FAILED` errors are considered transient and may be retried.
     */
    virtual Result<FetchedSource, LoaderError> fetch(const SourceConfig &source) = 0;
};

using SourceFetcherPtr = std::shared_ptr<SourceFetcher>;

/**
 * Fetches in-memory sources and local files. Remote origins are reported as unsupported.
 */
class LocalSourceFetcher : public SourceFetcher {
public:
    Result<FetchedSource, LoaderError> fetch(const SourceConfig &source) override;

private:
    Logger m_log{"source_fetcher"};
};

} // namespace shroud::dns
