/**
 * @file MimeTypes.cpp
 * @brief Implementation of MimeTypes.
 */

#include "infrastructure/MimeTypes.hpp"
#include <unordered_map>

namespace foldermapper::infrastructure {

std::optional<std::string> MimeTypes::Guess(const std::string& extension) {
    static const std::unordered_map<std::string, std::string> kTable = {
        {".txt", "text/plain"},
        {".md", "text/markdown"},
        {".html", "text/html"},
        {".htm", "text/html"},
        {".css", "text/css"},
        {".csv", "text/csv"},
        {".xml", "application/xml"},
        {".js", "text/javascript"},
        {".mjs", "text/javascript"},
        {".ts", "video/mp2t"},
        {".py", "text/x-python"},
        {".sh", "application/x-sh"},
        {".c", "text/x-c"},
        {".h", "text/x-c"},
        {".cpp", "text/x-c++src"},
        {".hpp", "text/x-c++hdr"},
        {".java", "text/x-java"},
        {".json", "application/json"},
        {".yaml", "application/yaml"},
        {".yml", "application/yaml"},
        {".sql", "application/sql"},
        {".pdf", "application/pdf"},
        {".doc", "application/msword"},
        {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
        {".xls", "application/vnd.ms-excel"},
        {".xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
        {".zip", "application/zip"},
        {".tar", "application/x-tar"},
        {".gz", "application/gzip"},
        {".rar", "application/vnd.rar"},
        {".7z", "application/x-7z-compressed"},
        {".exe", "application/x-msdownload"},
        {".dll", "application/x-msdownload"},
        {".so", "application/octet-stream"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".svg", "image/svg+xml"},
        {".ico", "image/vnd.microsoft.icon"},
        {".webp", "image/webp"},
        {".mp3", "audio/mpeg"},
        {".wav", "audio/x-wav"},
        {".mp4", "video/mp4"},
        {".woff", "font/woff"},
        {".woff2", "font/woff2"},
        {".ttf", "font/ttf"},
    };

    auto it = kTable.find(extension);
    if (it == kTable.end()) return std::nullopt;
    return it->second;
}

} // namespace foldermapper::infrastructure
