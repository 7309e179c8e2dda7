//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/guidemcp/PdfTextUnavailable.cpp
// Purpose: Extractor factory for builds without poppler-cpp
//==========================================================================================================

#include "guidemcp/PdfText.h"

namespace guidemcp {

std::shared_ptr<IPdfTextExtractor> MakePdfTextExtractor() {
    return nullptr;
}

} // namespace guidemcp
