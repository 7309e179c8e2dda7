//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/guidemcp/GuidelineCatalog.cpp
// Purpose: NCCN guideline index collaborator backed by a JSON index file
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>

#include "guidemcp/GuidelineCatalog.h"
#include "guidemcp/errors/Errors.h"
#include "logging/Logger.h"

namespace guidemcp {

namespace {

std::string lower(const std::string& s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string stringMember(const JSONValue& obj, const char* key, const char* fallback) {
    const JSONValue* v = obj.Find(key);
    if (v != nullptr && v->IsString()) {
        return std::get<std::string>(v->value);
    }
    return fallback;
}

JSONValue objectSchema(JSONValue::Object properties) {
    JSONValue::Object schema;
    schema["type"] = std::make_shared<JSONValue>("object");
    schema["properties"] = std::make_shared<JSONValue>(std::move(properties));
    return JSONValue(std::move(schema));
}

CallToolResult textResult(const std::string& text, bool isError = false) {
    CallToolResult r;
    r.content.push_back(MakeTextContent(text));
    r.isError = isError;
    return r;
}

JSONValue stringProperty(const std::string& description) {
    JSONValue::Object prop;
    prop["type"] = std::make_shared<JSONValue>("string");
    prop["description"] = std::make_shared<JSONValue>(description);
    return JSONValue(std::move(prop));
}

JSONValue requiredList(std::initializer_list<const char*> names) {
    JSONValue::Array list;
    for (const char* n : names) {
        list.push_back(std::make_shared<JSONValue>(std::string(n)));
    }
    return JSONValue(std::move(list));
}

std::string requireStringArgument(const JSONValue& arguments, const char* key) {
    const JSONValue* v = arguments.Find(key);
    if (v == nullptr || !v->IsString() || std::get<std::string>(v->value).empty()) {
        throw errors::GuidelineError(errors::GuidelineError::Kind::InvalidArguments,
                                     std::string("'") + key + "' must be a non-empty string");
    }
    return std::get<std::string>(v->value);
}

// Last path segment of a URL without query or fragment, reduced to a safe file name.
std::string fileNameFromUrl(const std::string& url) {
    std::string path = ParseUrl(url).path;
    path = path.substr(0, path.find('?'));
    std::string name = path.substr(path.rfind('/') + 1);
    name.erase(std::remove_if(name.begin(), name.end(),
                              [](unsigned char c) { return c == '\\' || c == ':' || std::iscntrl(c); }),
               name.end());
    while (!name.empty() && name.front() == '.') {
        name.erase(name.begin());
    }
    if (name.empty()) {
        name = "guideline.pdf";
    }
    if (lower(name).size() < 4 || lower(name).compare(lower(name).size() - 4, 4, ".pdf") != 0) {
        name += ".pdf";
    }
    return name;
}

// Writes through a temporary file so readers never see a partial file.
void writeFileAtomically(const std::filesystem::path& target, const std::string& data) {
    std::filesystem::path part = target;
    part += ".part";
    {
        std::ofstream out(part, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw std::runtime_error("Cannot write " + part.string());
        }
        out.write(data.data(), static_cast<std::streamsize>(data.size()));
        if (!out) {
            throw std::runtime_error("Short write to " + part.string());
        }
    }
    std::filesystem::rename(part, target);
}

} // namespace

std::size_t GuidelineIndex::GuidelineCount() const {
    std::size_t n = 0;
    for (const auto& c : categories) {
        n += c.guidelines.size();
    }
    return n;
}

GuidelineCatalog::GuidelineCatalog(GuidelineCatalogOptions options)
    : options_(std::move(options)) {}

GuidelineCatalog::~GuidelineCatalog() {
    StopRefresher();
}

GuidelineIndex GuidelineCatalog::ParseIndex(const std::string& text) {
    JSONValue root = ParseJSON(text);
    const JSONValue* list = root.Find("nccn_guidelines");
    if (list == nullptr || !list->IsArray()) {
        throw std::runtime_error("guideline index has no 'nccn_guidelines' array");
    }
    GuidelineIndex index;
    index.rawText = text;
    for (const auto& catPtr : std::get<JSONValue::Array>(list->value)) {
        if (!catPtr || !catPtr->IsObject()) {
            throw std::runtime_error("guideline index category is not an object");
        }
        GuidelineCategory category;
        category.category = stringMember(*catPtr, "category", "Unknown Category");
        if (const JSONValue* gl = catPtr->Find("guidelines"); gl != nullptr && gl->IsArray()) {
            for (const auto& gPtr : std::get<JSONValue::Array>(gl->value)) {
                if (!gPtr || !gPtr->IsObject()) {
                    continue;
                }
                category.guidelines.push_back(GuidelineEntry{stringMember(*gPtr, "title", "Unknown Title"),
                                                             stringMember(*gPtr, "url", "No URL")});
            }
        }
        index.categories.push_back(std::move(category));
    }
    return index;
}

std::string GuidelineCatalog::FormatIndex(const std::vector<GuidelineCategory>& categories) {
    std::ostringstream oss;
    oss << "NCCN Guidelines Index\n" << std::string(20, '=') << "\n\n";
    for (const auto& c : categories) {
        oss << "Category: " << c.category << "\n";
        oss << std::string(c.category.size() + 10, '-') << "\n";
        for (const auto& g : c.guidelines) {
            oss << "  \xE2\x80\xA2 " << g.title << "\n";
            oss << "    URL: " << g.url << "\n";
        }
        oss << "\n";
    }
    std::string out = oss.str();
    // Lines are newline-joined: the final separator contributes a single newline.
    if (!out.empty() && out.back() == '\n') {
        out.pop_back();
    }
    return out;
}

bool GuidelineCatalog::Reload() {
    std::lock_guard<std::mutex> reloadLock(reloadMutex_);
    std::string text;
    try {
        std::ifstream in(options_.indexPath, std::ios::in | std::ios::binary);
        if (!in.is_open()) {
            throw std::runtime_error("Guidelines index file not found: " + options_.indexPath.string());
        }
        std::ostringstream buf;
        buf << in.rdbuf();
        text = buf.str();
        auto parsed = std::make_shared<const GuidelineIndex>(ParseIndex(text));
        LOG_INFO("NCCN guidelines index ready: {} categories, {} guidelines",
                 parsed->categories.size(), parsed->GuidelineCount());
        {
            std::lock_guard<std::mutex> lk(mutex_);
            index_ = std::move(parsed);
            lastError_.clear();
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Error loading guidelines index {}: {}", options_.indexPath.string(), e.what());
        std::lock_guard<std::mutex> lk(mutex_);
        lastError_ = e.what();
        return false;
    }
    return true;
}

bool GuidelineCatalog::isStale() const {
    std::error_code ec;
    const auto written = std::filesystem::last_write_time(options_.indexPath, ec);
    if (ec) {
        LOG_DEBUG("Cannot stat guidelines index {}: {}", options_.indexPath.string(), ec.message());
        return true;
    }
    const auto age = std::filesystem::file_time_type::clock::now() - written;
    if (age > options_.maxAge) {
        LOG_INFO("Guidelines index {} is {} hours old (refresh threshold {} hours)",
                 options_.indexPath.string(),
                 std::chrono::duration_cast<std::chrono::hours>(age).count(),
                 options_.maxAge.count());
        return true;
    }
    return false;
}

bool GuidelineCatalog::EnsureFresh(std::stop_token stop) {
    if (!isStale()) {
        return Reload();
    }
    if (options_.indexUrl.empty()) {
        LOG_WARN("Guidelines index {} needs a refresh but no index URL is configured", options_.indexPath.string());
        return Reload();
    }
    try {
        LOG_INFO("Downloading guidelines index from {}", options_.indexUrl);
        HttpFetcher fetcher(options_.fetch);
        HttpFetchResult res = fetcher.Get(options_.indexUrl, stop);
        if (res.status != 200) {
            throw std::runtime_error("HTTP " + std::to_string(res.status) + " from " + res.finalUrl);
        }
        const GuidelineIndex parsed = ParseIndex(res.body);
        if (options_.indexPath.has_parent_path()) {
            std::filesystem::create_directories(options_.indexPath.parent_path());
        }
        writeFileAtomically(options_.indexPath, res.body);
        LOG_INFO("Guidelines index refreshed: {} categories, {} guidelines",
                 parsed.categories.size(), parsed.GuidelineCount());
    } catch (const std::exception& e) {
        LOG_ERROR("Could not refresh guidelines index from {}: {}", options_.indexUrl, e.what());
    }
    return Reload();
}

void GuidelineCatalog::StartRefresher(std::chrono::milliseconds interval) {
    StopRefresher();
    {
        std::lock_guard<std::mutex> lk(refresherMutex_);
        refresherStopping_ = false;
        refresherStop_ = std::stop_source();
    }
    std::stop_token token = refresherStop_.get_token();
    LOG_INFO("Refreshing guidelines index {} every {} ms", options_.indexPath.string(), interval.count());
    refresher_ = std::thread([this, interval, token]() {
        for (;;) {
            (void)EnsureFresh(token);
            std::unique_lock<std::mutex> lk(refresherMutex_);
            if (refresherCv_.wait_for(lk, interval, [this]() { return refresherStopping_; })) {
                return;
            }
        }
    });
}

void GuidelineCatalog::StopRefresher() {
    {
        std::lock_guard<std::mutex> lk(refresherMutex_);
        refresherStopping_ = true;
        refresherStop_.request_stop();
    }
    refresherCv_.notify_all();
    if (refresher_.joinable()) {
        refresher_.join();
    }
}

bool GuidelineCatalog::IsLoaded() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return index_ != nullptr;
}

std::string GuidelineCatalog::LastError() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return lastError_;
}

std::shared_ptr<const GuidelineIndex> GuidelineCatalog::Snapshot() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return index_;
}

// Loads on first use when the background load has not produced an index yet.
std::shared_ptr<const GuidelineIndex> GuidelineCatalog::current() {
    if (auto snap = Snapshot()) {
        return snap;
    }
    if (Reload()) {
        return Snapshot();
    }
    return nullptr;
}

std::vector<Tool> GuidelineCatalog::ListTools() {
    std::vector<Tool> tools;
    tools.emplace_back(kGetIndexTool,
                       "Get the raw contents of the NCCN guidelines index file.",
                       objectSchema({}));

    JSONValue::Object categoryProp;
    categoryProp["type"] = std::make_shared<JSONValue>("string");
    categoryProp["description"] = std::make_shared<JSONValue>(
        "Only list guidelines of this category (case-insensitive exact match).");
    JSONValue::Object props;
    props["category"] = std::make_shared<JSONValue>(std::move(categoryProp));
    tools.emplace_back(kListGuidelinesTool,
                       "List NCCN guidelines with their URLs, optionally restricted to one category.",
                       objectSchema(std::move(props)));

    JSONValue::Object downloadProps;
    downloadProps["url"] = std::make_shared<JSONValue>(stringProperty("URL of the guideline PDF."));
    JSONValue downloadSchema = objectSchema(std::move(downloadProps));
    std::get<JSONValue::Object>(downloadSchema.value)["required"] = std::make_shared<JSONValue>(requiredList({"url"}));
    tools.emplace_back(kDownloadPdfTool,
                       "Download a guideline PDF into the downloads directory, logging in to NCCN when "
                       "NCCN_USERNAME and NCCN_PASSWORD are set.",
                       std::move(downloadSchema));

    JSONValue::Object extractProps;
    extractProps["pdf_path"] = std::make_shared<JSONValue>(
        stringProperty("PDF path, absolute or relative to the downloads directory."));
    extractProps["pages"] = std::make_shared<JSONValue>(
        stringProperty("Comma separated pages and ranges such as \"1,3,5-7\"; negative numbers count from the end. "
                       "All pages when omitted."));
    JSONValue extractSchema = objectSchema(std::move(extractProps));
    std::get<JSONValue::Object>(extractSchema.value)["required"] = std::make_shared<JSONValue>(requiredList({"pdf_path"}));
    tools.emplace_back(kExtractContentTool,
                       "Extract the text of selected pages of a PDF file.",
                       std::move(extractSchema));
    return tools;
}

bool GuidelineCatalog::ToolMayStream(const std::string& name) const {
    return name == kListGuidelinesTool || name == kDownloadPdfTool || name == kExtractContentTool;
}

CallToolResult GuidelineCatalog::CallTool(const std::string& name, const JSONValue& arguments,
                                          const ToolCallContext& ctx) {
    if (name == kGetIndexTool) {
        return getIndex();
    }
    if (name == kListGuidelinesTool) {
        return listGuidelines(arguments, ctx);
    }
    if (name == kDownloadPdfTool) {
        return downloadPdf(arguments, ctx);
    }
    if (name == kExtractContentTool) {
        return extractContent(arguments, ctx);
    }
    throw errors::GuidelineError(errors::GuidelineError::Kind::UnknownTool, "Unknown tool: " + name);
}

CallToolResult GuidelineCatalog::getIndex() {
    auto index = current();
    if (!index) {
        return textResult("Error: " + LastError(), true);
    }
    LOG_INFO("Served raw guidelines index ({} bytes)", index->rawText.size());
    return textResult(index->rawText);
}

CallToolResult GuidelineCatalog::listGuidelines(const JSONValue& arguments, const ToolCallContext& ctx) {
    std::optional<std::string> filter;
    if (const JSONValue* c = arguments.Find("category")) {
        if (!c->IsString()) {
            throw errors::GuidelineError(errors::GuidelineError::Kind::InvalidArguments,
                                         "'category' must be a string");
        }
        filter = lower(std::get<std::string>(c->value));
    }

    auto index = current();
    if (!index) {
        return textResult("Error loading guidelines: " + LastError(), true);
    }

    const auto total = static_cast<double>(index->categories.size());
    std::vector<GuidelineCategory> matched;
    double scanned = 0;
    for (const auto& category : index->categories) {
        if (ctx.stop.stop_requested()) {
            LOG_DEBUG("list_guidelines stopped after {} categories", scanned);
            return textResult("Cancelled", true);
        }
        scanned += 1;
        if (!filter.has_value() || lower(category.category) == filter.value()) {
            matched.push_back(category);
        }
        ctx.ReportProgress(scanned, total, "Scanned " + category.category);
    }

    if (filter.has_value() && matched.empty()) {
        std::ostringstream oss;
        oss << "No guidelines found for category '" << std::get<std::string>(arguments.Find("category")->value)
            << "'. Available categories:";
        for (const auto& category : index->categories) {
            oss << "\n  " << category.category;
        }
        return textResult(oss.str(), true);
    }
    return textResult(FormatIndex(matched));
}

CallToolResult GuidelineCatalog::downloadPdf(const JSONValue& arguments, const ToolCallContext& ctx) {
    const std::string url = requireStringArgument(arguments, "url");
    const bool authenticated = !options_.username.empty() && !options_.password.empty();
    std::string fileName = "unknown";
    try {
        fileName = fileNameFromUrl(url);
        std::filesystem::create_directories(options_.downloadDir);
        const std::filesystem::path target = options_.downloadDir / fileName;

        std::error_code ec;
        if (std::filesystem::is_regular_file(target, ec) && std::filesystem::file_size(target, ec) > 0) {
            LOG_INFO("{} already downloaded; skipping", target.string());
            return textResult("PDF downloaded successfully: " + target.string() + " (filename: " + fileName + ")");
        }

        HttpFetcher fetcher(options_.fetch);
        if (authenticated) {
            LOG_INFO("Using NCCN authentication for user: {}", options_.username);
            ctx.ReportProgress(0, 2.0, "Logging in to NCCN");
            HttpFetchResult login = fetcher.PostForm(options_.loginUrl,
                                                     {{"Username", options_.username}, {"Password", options_.password}},
                                                     ctx.stop);
            if (login.status >= 400) {
                LOG_WARN("NCCN login returned HTTP {}; trying the download anyway", login.status);
            }
        } else {
            LOG_INFO("No NCCN authentication configured - attempting anonymous download");
        }

        ctx.ReportProgress(1, 2.0, "Downloading " + fileName);
        HttpFetchResult res = fetcher.Get(url, ctx.stop);
        if (ctx.stop.stop_requested()) {
            return textResult("Cancelled", true);
        }
        const bool isPdf = res.body.compare(0, 5, "%PDF-") == 0;
        if (res.status != 200 || !isPdf) {
            std::string message = "Failed to download PDF from " + url + " (attempted filename: " + fileName + ").";
            if (!authenticated) {
                message += " You may need to provide NCCN login credentials via environment variables "
                           "(NCCN_USERNAME, NCCN_PASSWORD).";
            }
            LOG_ERROR("{} HTTP {}, {} bytes of {}", message, res.status, res.body.size(),
                      res.contentType.empty() ? std::string("unknown type") : res.contentType);
            return textResult(message, true);
        }

        writeFileAtomically(target, res.body);
        ctx.ReportProgress(2, 2.0, "Saved " + fileName);
        LOG_INFO("PDF downloaded successfully: {} ({} bytes)", target.string(), res.body.size());
        return textResult("PDF downloaded successfully: " + target.string() + " (filename: " + fileName + ")");
    } catch (const std::exception& e) {
        if (ctx.stop.stop_requested()) {
            return textResult("Cancelled", true);
        }
        LOG_ERROR("Error downloading PDF {}: {}", url, e.what());
        return textResult(std::string("Error downloading PDF: ") + e.what(), true);
    }
}

CallToolResult GuidelineCatalog::extractContent(const JSONValue& arguments, const ToolCallContext& ctx) {
    const std::string pdfPath = requireStringArgument(arguments, "pdf_path");
    std::string pages;
    if (const JSONValue* p = arguments.Find("pages")) {
        if (!p->IsString()) {
            throw errors::GuidelineError(errors::GuidelineError::Kind::InvalidArguments, "'pages' must be a string");
        }
        pages = std::get<std::string>(p->value);
    }
    const std::string pagesLabel = pages.empty() ? std::string("all") : pages;

    std::filesystem::path resolved(pdfPath);
    std::error_code ec;
    if (resolved.is_relative()) {
        const std::filesystem::path inDownloads = options_.downloadDir / resolved;
        if (std::filesystem::exists(inDownloads, ec)) {
            resolved = inDownloads;
        } else if (!std::filesystem::exists(resolved, ec)) {
            LOG_ERROR("PDF file not found: {}", pdfPath);
            return textResult("PDF file not found: " + pdfPath, true);
        }
    } else if (!std::filesystem::exists(resolved, ec)) {
        LOG_ERROR("PDF file not found: {}", pdfPath);
        return textResult("PDF file not found: " + pdfPath, true);
    }

    if (!options_.pdfText) {
        return textResult("PDF text extraction is not available in this build (poppler-cpp not found)", true);
    }

    try {
        std::unique_ptr<IPdfDocument> doc = options_.pdfText->Open(resolved);
        const std::vector<std::size_t> selected = ParsePageSelection(pages, doc->PageCount());
        std::string content;
        bool anyText = false;
        for (std::size_t i = 0; i < selected.size(); ++i) {
            if (ctx.stop.stop_requested()) {
                LOG_DEBUG("extract_content stopped after {} pages", i);
                return textResult("Cancelled", true);
            }
            const std::string text = doc->PageText(selected[i]);
            anyText = anyText || text.find_first_not_of(" \t\r\n\f") != std::string::npos;
            content += "--- Page " + std::to_string(selected[i] + 1) + " ---\n" + text;
            if (content.empty() || content.back() != '\n') {
                content += '\n';
            }
            ctx.ReportProgress(static_cast<double>(i + 1), static_cast<double>(selected.size()),
                               "Extracted page " + std::to_string(selected[i] + 1));
        }
        if (!anyText) {
            LOG_WARN("No content extracted from {} (pages: {})", resolved.string(), pagesLabel);
            return textResult("No content extracted from " + resolved.string() + " (pages: " + pagesLabel + ")");
        }
        LOG_INFO("Extracted content from {} (pages: {})", resolved.string(), pagesLabel);
        return textResult(content);
    } catch (const std::exception& e) {
        LOG_ERROR("Error extracting content from PDF {}: {}", resolved.string(), e.what());
        return textResult(std::string("Error extracting content from PDF: ") + e.what(), true);
    }
}

std::vector<Resource> GuidelineCatalog::ListResources() {
    return {Resource(kIndexResourceUri, "NCCN Guidelines Index",
                     std::string("All available NCCN guidelines organized by category with their URLs."),
                     std::string("text/plain"))};
}

ReadResourceResult GuidelineCatalog::ReadResource(const std::string& uri, std::stop_token) {
    if (uri != kIndexResourceUri) {
        throw errors::GuidelineError(errors::GuidelineError::Kind::ResourceNotFound, "Resource not found: " + uri);
    }
    ReadResourceResult result;
    auto index = current();
    if (!index) {
        result.contents.push_back(MakeTextResourceContents(uri, "text/plain", "Error loading guidelines: " + LastError()));
        return result;
    }
    result.contents.push_back(MakeTextResourceContents(uri, "text/plain", FormatIndex(index->categories)));
    return result;
}

} // namespace guidemcp
