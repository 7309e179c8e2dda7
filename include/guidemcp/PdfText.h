//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PdfText.h
// Purpose: PDF page text extraction contract and page selection parsing
//==========================================================================================================

#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace guidemcp {

class IPdfDocument {
public:
    virtual ~IPdfDocument() = default;
    virtual std::size_t PageCount() const = 0;
    // Plain text of one page; index is zero based.
    virtual std::string PageText(std::size_t index) const = 0;
};

//==========================================================================================================
// IPdfTextExtractor
// Purpose: Opens PDF files for text extraction.
// Notes:
//   Open throws std::runtime_error when the file is not a readable, unlocked PDF.
//==========================================================================================================
class IPdfTextExtractor {
public:
    virtual ~IPdfTextExtractor() = default;
    virtual std::unique_ptr<IPdfDocument> Open(const std::filesystem::path& pdf) = 0;
};

// Extractor built into this binary (poppler-cpp), or nullptr when the build has none.
std::shared_ptr<IPdfTextExtractor> MakePdfTextExtractor();

//==========================================================================================================
// ParsePageSelection
// Purpose: Resolves a page selection such as "1,3,5-7" against a document.
// Args:
//   selection: Comma separated one-based pages and inclusive ranges. Negative numbers count from
//              the end (-1 is the last page). Empty selects every page.
//   pageCount: Pages in the document.
// Returns:
//   Zero-based page indexes in selection order.
// Throws:
//   std::invalid_argument for malformed items, page 0, pages out of range, or reversed ranges.
//==========================================================================================================
std::vector<std::size_t> ParsePageSelection(const std::string& selection, std::size_t pageCount);

} // namespace guidemcp
