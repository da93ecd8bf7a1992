// Copyright (c) 2026 changcheng967. All rights reserved.

#include <folio/core/mime.hpp>
#include <folio/core/config.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <utility>

namespace folio::core {

namespace {

using MimePair = std::pair<std::string_view, std::string_view>;

constexpr std::array<MimePair, 27> MIME_TABLE{{
    // Documents
    {"xhtml", "application/xhtml+xml"},
    {"html",  "text/html"},
    {"htm",   "text/html"},
    {"xml",   "application/xml"},
    {"css",   "text/css"},
    {"ncx",   "application/x-dtbncx+xml"},
    {"opf",   "application/oebps-package+xml"},
    {"pdf",   "application/pdf"},
    {"js",    "application/javascript"},
    // Images
    {"jpg",   "image/jpeg"},
    {"jpeg",  "image/jpeg"},
    {"png",   "image/png"},
    {"gif",   "image/gif"},
    {"svg",   "image/svg+xml"},
    {"webp",  "image/webp"},
    // Fonts
    {"woff",  "font/woff"},
    {"woff2", "font/woff2"},
    {"ttf",   "font/ttf"},
    {"otf",   "font/otf"},
    // Audio
    {"mp3",   "audio/mpeg"},
    {"m4a",   "audio/mp4"},
    {"ogg",   "audio/ogg"},
    {"wav",   "audio/wav"},
    // Video
    {"mp4",   "video/mp4"},
    {"webm",  "video/webm"},
    // Text
    {"txt",   "text/plain"},
    {"json",  "application/json"},
}};

} // namespace

std::string_view guess_mime_type(std::string_view href) noexcept {
    // Drop query/fragment, then look only at the last path component
    auto cut = href.find_first_of("?#");
    if (cut != std::string_view::npos) {
        href = href.substr(0, cut);
    }
    auto slash = href.rfind('/');
    if (slash != std::string_view::npos) {
        href = href.substr(slash + 1);
    }

    auto dot = href.rfind('.');
    if (dot == std::string_view::npos || dot + 1 >= href.size()) {
        return DEFAULT_MIME_TYPE;
    }

    auto ext = href.substr(dot + 1);
    if (ext.size() > 5) {
        return DEFAULT_MIME_TYPE;
    }

    char lower[6] = {};
    for (std::size_t i = 0; i < ext.size(); ++i) {
        lower[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(ext[i])));
    }
    std::string_view key(lower, ext.size());

    auto it = std::find_if(MIME_TABLE.begin(), MIME_TABLE.end(),
                           [key](const MimePair& p) { return p.first == key; });
    return it != MIME_TABLE.end() ? it->second : DEFAULT_MIME_TYPE;
}

} // namespace folio::core
