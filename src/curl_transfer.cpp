#include "batchdl/curl_transfer.hpp"

#include "batchdl/detail/curl_utils.hpp"
#include "batchdl/errors.hpp"
#include "batchdl/execution_scope.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
#include <utility>

namespace batchdl {

namespace {

struct FileDeleter {
    void operator()(FILE* fp) const noexcept {
        if (fp) {
            std::fclose(fp);
        }
    }
};

using FilePtr = std::unique_ptr<FILE, FileDeleter>;

struct WriteContext {
    FILE* file{nullptr};
    ByteCountSink* sink{nullptr};
    const ExecutionScope* scope{nullptr};
    std::string error;
};

size_t collectHeaders(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* headers = static_cast<std::string*>(userdata);
    headers->append(ptr, size * nmemb);
    return size * nmemb;
}

size_t writeToFile(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<WriteContext*>(userdata);
    const size_t total = size * nmemb;
    if (total == 0) {
        return 0;
    }

    const size_t written = std::fwrite(ptr, 1, total, ctx->file);
    if (written != total) {
        ctx->error = "Failed to write output file";
    }
    if (written > 0) {
        ctx->sink->push(static_cast<std::int64_t>(written));
    }
    return written;
}

int abortWhenStopped(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* ctx = static_cast<const WriteContext*>(userdata);
    return ctx->scope->isStopped() ? 1 : 0;
}

bool acceptsByteRanges(std::string headers) {
    std::transform(headers.begin(), headers.end(), headers.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return headers.find("accept-ranges: bytes") != std::string::npos;
}

void applyCommonOptions(CURL* curl, const std::string& url, const CurlOptions& options) {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, options.follow_redirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options.connect_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_USERAGENT, options.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
}

std::int64_t existingSize(const std::string& path) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    return ec ? 0 : static_cast<std::int64_t>(size);
}

} // namespace

CurlSizeProber::CurlSizeProber(CurlOptions options) : options_(std::move(options)) {}

ResumeInfo CurlSizeProber::probe(const std::string& url) {
    auto curl = detail::makeCurlHandle();
    if (!curl) {
        throw ProbeError(url, "Failed to allocate curl handle");
    }

    std::string headers;
    applyCommonOptions(curl.get(), url, options_);
    curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_HEADER, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &collectHeaders);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &headers);

    const CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw ProbeError(url, curl_easy_strerror(res));
    }

    curl_off_t length = -1;
    curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);

    ResumeInfo info;
    info.content_length = static_cast<std::int64_t>(length);
    info.resumable = acceptsByteRanges(std::move(headers));
    return info;
}

CurlTransferWorker::CurlTransferWorker(CurlOptions options) : options_(std::move(options)) {}

void CurlTransferWorker::transfer(const ExecutionScope& scope,
                                  const DownloadRequest& request,
                                  const ResumeInfo& resume,
                                  ByteCountSink& sink) {
    if (scope.isStopped()) {
        return;
    }

    std::int64_t offset = 0;
    if (resume.resumable) {
        offset = existingSize(request.destination);
        if (offset > resume.content_length) {
            offset = 0;
        }
    }

    // A complete file from an earlier run only needs to be accounted for.
    if (offset > 0 && offset == resume.content_length) {
        sink.push(offset);
        return;
    }

    FilePtr file{std::fopen(request.destination.c_str(), offset > 0 ? "ab" : "wb")};
    if (!file) {
        throw TransferError(request.url, "Cannot create destination file " + request.destination);
    }
    if (offset > 0) {
        sink.push(offset);
    }

    auto curl = detail::makeCurlHandle();
    if (!curl) {
        throw TransferError(request.url, "Failed to allocate curl handle");
    }

    WriteContext ctx{file.get(), &sink, &scope, {}};
    applyCommonOptions(curl.get(), request.url, options_);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &writeToFile);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, &abortWhenStopped);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &ctx);
    if (offset > 0) {
        curl_easy_setopt(curl.get(), CURLOPT_RESUME_FROM_LARGE, static_cast<curl_off_t>(offset));
    }

    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        scope.deadline() - ExecutionScope::Clock::now());
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(std::max<std::int64_t>(1, remaining.count())));

    const CURLcode res = curl_easy_perform(curl.get());
    if (std::fflush(file.get()) != 0 && ctx.error.empty()) {
        ctx.error = "Failed to flush output file";
    }

    if (res != CURLE_OK && scope.isStopped()) {
        return;
    }
    if (!ctx.error.empty()) {
        throw TransferError(request.url, ctx.error);
    }
    if (res != CURLE_OK) {
        throw TransferError(request.url, std::string{"curl error: "} + curl_easy_strerror(res));
    }
}

} // namespace batchdl
