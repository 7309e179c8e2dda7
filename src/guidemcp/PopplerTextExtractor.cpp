//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/guidemcp/PopplerTextExtractor.cpp
// Purpose: PDF text extraction with poppler-cpp
//==========================================================================================================

#include <stdexcept>

#include <poppler-document.h>
#include <poppler-page.h>

#include "guidemcp/PdfText.h"
#include "logging/Logger.h"

namespace guidemcp {

namespace {

class PopplerDocument : public IPdfDocument {
public:
    PopplerDocument(std::unique_ptr<poppler::document> doc, std::string name)
        : doc_(std::move(doc)), name_(std::move(name)) {}

    std::size_t PageCount() const override {
        return static_cast<std::size_t>(doc_->pages());
    }

    std::string PageText(std::size_t index) const override {
        std::unique_ptr<poppler::page> page(doc_->create_page(static_cast<int>(index)));
        if (!page) {
            throw std::runtime_error("Cannot read page " + std::to_string(index + 1) + " of " + name_);
        }
        const poppler::byte_array utf8 = page->text().to_utf8();
        return std::string(utf8.begin(), utf8.end());
    }

private:
    std::unique_ptr<poppler::document> doc_;
    std::string name_;
};

class PopplerTextExtractor : public IPdfTextExtractor {
public:
    std::unique_ptr<IPdfDocument> Open(const std::filesystem::path& pdf) override {
        std::unique_ptr<poppler::document> doc(poppler::document::load_from_file(pdf.string()));
        if (!doc) {
            throw std::runtime_error("Cannot open PDF " + pdf.string());
        }
        if (doc->is_locked()) {
            throw std::runtime_error("PDF " + pdf.string() + " is password protected");
        }
        LOG_DEBUG("Opened {} ({} pages)", pdf.string(), doc->pages());
        return std::make_unique<PopplerDocument>(std::move(doc), pdf.filename().string());
    }
};

} // namespace

std::shared_ptr<IPdfTextExtractor> MakePdfTextExtractor() {
    return std::make_shared<PopplerTextExtractor>();
}

} // namespace guidemcp
