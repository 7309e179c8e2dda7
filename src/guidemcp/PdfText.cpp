//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/guidemcp/PdfText.cpp
// Purpose: Page selection parsing for PDF text extraction
//==========================================================================================================

#include <charconv>
#include <stdexcept>

#include "guidemcp/PdfText.h"

namespace guidemcp {

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return std::string();
    }
    const auto last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

// One-based page number (negative counts from the end) to a zero-based index.
std::size_t resolvePage(const std::string& text, std::size_t pageCount) {
    long long n = 0;
    const std::string t = trim(text);
    auto [ptr, ec] = std::from_chars(t.data(), t.data() + t.size(), n);
    if (t.empty() || ec != std::errc() || ptr != t.data() + t.size()) {
        throw std::invalid_argument("Invalid page number '" + t + "'");
    }
    const auto count = static_cast<long long>(pageCount);
    const long long oneBased = n < 0 ? count + n + 1 : n;
    if (n == 0 || oneBased < 1 || oneBased > count) {
        throw std::invalid_argument("Page " + t + " is out of range (document has " + std::to_string(pageCount) + " pages)");
    }
    return static_cast<std::size_t>(oneBased - 1);
}

} // namespace

std::vector<std::size_t> ParsePageSelection(const std::string& selection, std::size_t pageCount) {
    std::vector<std::size_t> pages;
    if (trim(selection).empty()) {
        for (std::size_t i = 0; i < pageCount; ++i) {
            pages.push_back(i);
        }
        return pages;
    }

    std::size_t start = 0;
    while (start <= selection.size()) {
        std::size_t comma = selection.find(',', start);
        const std::string item = trim(comma == std::string::npos ? selection.substr(start)
                                                                 : selection.substr(start, comma - start));
        if (!item.empty()) {
            // A leading '-' is a sign, so a range separator is searched from the second character.
            const std::size_t dash = item.find('-', 1);
            if (dash == std::string::npos) {
                pages.push_back(resolvePage(item, pageCount));
            } else {
                const std::size_t from = resolvePage(item.substr(0, dash), pageCount);
                const std::size_t to = resolvePage(item.substr(dash + 1), pageCount);
                if (from > to) {
                    throw std::invalid_argument("Page range '" + item + "' is reversed");
                }
                for (std::size_t i = from; i <= to; ++i) {
                    pages.push_back(i);
                }
            }
        }
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
    return pages;
}

} // namespace guidemcp
