#include "media_type.hpp"
#include "helpers.hpp"
#include <algorithm>
#include <cctype>
#include <string>
#include <unordered_map>

static const std::unordered_map<std::string, std::string> ext_to_mime = {
    // archives
    {".zip",    "application/zip"},
    {".jar",    "application/java-archive"},
    {".war",    "application/java-archive"},
    {".apk",    "application/vnd.android.package-archive"},
    {".epub",   "application/epub+zip"},
    {".7z",     "application/x-7z-compressed"},
    {".tar",    "application/x-tar"},
    {".gz",     "application/gzip"},
    {".bz2",    "application/x-bzip2"},
    {".xz",     "application/x-xz"},
    {".rar",    "application/vnd.rar"},
    {".cab",    "application/vnd.ms-cab-compressed"},

    // java
    {".class",  "application/java-vm"},
    {".mf",     "text/plain"},

    // text
    {".txt",    "text/plain"},
    {".log",    "text/plain"},
    {".csv",    "text/csv"},
    {".htm",    "text/html"},
    {".html",   "text/html"},
    {".css",    "text/css"},
    {".js",     "text/javascript"},
    {".xml",    "text/xml"},
    {".json",   "application/json"},
    {".properties", "text/plain"},
    {".rtf",    "application/rtf"},

    // images
    {".jpg",    "image/jpeg"},
    {".jpeg",   "image/jpeg"},
    {".png",    "image/png"},
    {".gif",    "image/gif"},
    {".bmp",    "image/bmp"},
    {".tif",    "image/tiff"},
    {".tiff",   "image/tiff"},
    {".webp",   "image/webp"},
    {".svg",    "image/svg+xml"},
    {".ico",    "image/vnd.microsoft.icon"},
    {".emf",    "image/emf"},
    {".wmf",    "image/wmf"},

    // documents
    {".pdf",    "application/pdf"},
    {".doc",    "application/msword"},
    {".dot",    "application/msword"},
    {".xls",    "application/vnd.ms-excel"},
    {".ppt",    "application/vnd.ms-powerpoint"},
    {".msg",    "application/vnd.ms-outlook"},
    {".docx",   "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
    {".xlsx",   "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
    {".pptx",   "application/vnd.openxmlformats-officedocument.presentationml.presentation"},
    {".odt",    "application/vnd.oasis.opendocument.text"},
    {".ods",    "application/vnd.oasis.opendocument.spreadsheet"},
    {".odp",    "application/vnd.oasis.opendocument.presentation"},

    // executables
    {".exe",    "application/x-msdownload"},
    {".dll",    "application/x-msdownload"},
    {".bin",    "application/octet-stream"},
};

std::string guessMediaType(const std::string& name) {
    std::string base = finalSegment(name);
    size_t dot = base.find_last_of('.');
    if (dot == std::string::npos || dot == 0)
        return "application/octet-stream";

    std::string ext = base.substr(dot);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = ext_to_mime.find(ext);
    return it != ext_to_mime.end() ? it->second : "application/octet-stream";
}
