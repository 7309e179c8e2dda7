//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: GuidelineCatalog.h
// Purpose: NCCN guideline index collaborator backed by a JSON index file
//==========================================================================================================

#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "guidemcp/GuidelineProvider.h"
#include "guidemcp/HttpFetcher.h"
#include "guidemcp/PdfText.h"

namespace guidemcp {

struct GuidelineEntry {
    std::string title;
    std::string url;
};

struct GuidelineCategory {
    std::string category;
    std::vector<GuidelineEntry> guidelines;
};

//==========================================================================================================
// GuidelineIndex
// Purpose: Parsed snapshot of the index file.
// Fields:
//   categories: Categories in file order.
//   rawText: File contents exactly as read (served by get_index).
//==========================================================================================================
struct GuidelineIndex {
    std::vector<GuidelineCategory> categories;
    std::string rawText;

    std::size_t GuidelineCount() const;
};

//==========================================================================================================
// GuidelineCatalogOptions
// Fields:
//   indexPath: Local index file
//   maxAge: Age after which the index is refreshed from indexUrl
//   indexUrl: Where a fresh index is downloaded from; empty disables downloads
//   downloadDir: Target of download_pdf and first lookup place of extract_content
//   username/password: NCCN credentials; both must be set for a login to be attempted
//   loginUrl: Form login endpoint posted with Username/Password
//   fetch: HTTP client settings
//   pdfText: Extractor behind extract_content; nullptr makes the tool report it is unavailable
//==========================================================================================================
struct GuidelineCatalogOptions {
    std::filesystem::path indexPath{"nccn_guidelines_index.json"};
    std::chrono::hours maxAge{std::chrono::hours(24 * 7)};
    std::string indexUrl;
    std::filesystem::path downloadDir{"downloads"};
    std::string username;
    std::string password;
    std::string loginUrl{"https://www.nccn.org/login/Index/"};
    HttpFetchOptions fetch;
    std::shared_ptr<IPdfTextExtractor> pdfText{MakePdfTextExtractor()};
};

//==========================================================================================================
// GuidelineCatalog
// Purpose: Reference IGuidelineProvider.
//   resource nccn://guidelines-index   formatted text index
//   tool get_index                     raw index file
//   tool list_guidelines {category?}   index filtered by category, one progress frame per category
//   tool download_pdf {url}            guideline PDF saved under downloadDir
//   tool extract_content {pdf_path, pages?}  text of selected PDF pages
// Notes:
//   A missing or malformed index is not a protocol error: tools answer with isError results and the
//   resource answers with an explanatory text, so clients can still see why nothing is listed.
//==========================================================================================================
class GuidelineCatalog : public IGuidelineProvider {
public:
    static constexpr const char* kIndexResourceUri = "nccn://guidelines-index";
    static constexpr const char* kGetIndexTool = "get_index";
    static constexpr const char* kListGuidelinesTool = "list_guidelines";
    static constexpr const char* kDownloadPdfTool = "download_pdf";
    static constexpr const char* kExtractContentTool = "extract_content";

    explicit GuidelineCatalog(GuidelineCatalogOptions options);
    ~GuidelineCatalog() override;

    GuidelineCatalog(const GuidelineCatalog&) = delete;
    GuidelineCatalog& operator=(const GuidelineCatalog&) = delete;

    //======================================================================================================
    // Reload
    // Purpose: Reads and parses the index file, replacing the current snapshot on success.
    // Returns:
    //   true on success; on failure the previous snapshot (if any) is kept and the error is
    //   remembered for LastError().
    //======================================================================================================
    bool Reload();

    //======================================================================================================
    // EnsureFresh
    // Purpose: Downloads the index from indexUrl when the local file is missing or older than maxAge,
    //          then reloads it. A failed download keeps the existing file.
    // Returns:
    //   Result of the final Reload().
    //======================================================================================================
    bool EnsureFresh(std::stop_token stop = {});

    // Runs EnsureFresh() now and then every interval on a background thread until StopRefresher().
    void StartRefresher(std::chrono::milliseconds interval);
    void StopRefresher();

    bool IsLoaded() const;
    std::string LastError() const;
    std::shared_ptr<const GuidelineIndex> Snapshot() const;

    // Throws std::runtime_error when the text is not a guideline index.
    static GuidelineIndex ParseIndex(const std::string& text);

    // Human-readable rendering of the given categories.
    static std::string FormatIndex(const std::vector<GuidelineCategory>& categories);

    // IGuidelineProvider
    std::vector<Tool> ListTools() override;
    bool ToolMayStream(const std::string& name) const override;
    CallToolResult CallTool(const std::string& name, const JSONValue& arguments,
                            const ToolCallContext& ctx) override;
    std::vector<Resource> ListResources() override;
    ReadResourceResult ReadResource(const std::string& uri, std::stop_token stop) override;

private:
    std::shared_ptr<const GuidelineIndex> current();
    CallToolResult getIndex();
    CallToolResult listGuidelines(const JSONValue& arguments, const ToolCallContext& ctx);
    CallToolResult downloadPdf(const JSONValue& arguments, const ToolCallContext& ctx);
    CallToolResult extractContent(const JSONValue& arguments, const ToolCallContext& ctx);
    bool isStale() const;

    const GuidelineCatalogOptions options_;

    mutable std::mutex mutex_;
    std::shared_ptr<const GuidelineIndex> index_;
    std::string lastError_;

    std::mutex reloadMutex_;

    std::mutex refresherMutex_;
    std::condition_variable refresherCv_;
    bool refresherStopping_{false};
    std::stop_source refresherStop_;
    std::thread refresher_;
};

} // namespace guidemcp
