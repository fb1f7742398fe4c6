// Extension-based MIME lookup with the text override for classified content.
#include "remotefs/MimeTypes.hpp"
#include <cctype>
#include <unordered_map>

namespace remotefs {

namespace {

const std::unordered_map<std::string, std::string>& mimeTable() {
    static const std::unordered_map<std::string, std::string> table = {
        // text and markup
        {".txt", "text/plain"}, {".log", "text/plain"}, {".ini", "text/plain"},
        {".conf", "text/plain"}, {".md", "text/markdown"}, {".csv", "text/csv"},
        {".tsv", "text/tab-separated-values"}, {".htm", "text/html"}, {".html", "text/html"},
        {".css", "text/css"}, {".js", "text/javascript"}, {".mjs", "text/javascript"},
        {".xml", "application/xml"}, {".json", "application/json"}, {".yaml", "application/yaml"},
        {".yml", "application/yaml"}, {".rtf", "application/rtf"}, {".svg", "image/svg+xml"},
        {".sh", "application/x-sh"},
        // images
        {".png", "image/png"}, {".jpg", "image/jpeg"}, {".jpeg", "image/jpeg"},
        {".gif", "image/gif"}, {".bmp", "image/bmp"}, {".webp", "image/webp"},
        {".ico", "image/x-icon"}, {".tif", "image/tiff"}, {".tiff", "image/tiff"},
        // audio and video
        {".mp3", "audio/mpeg"}, {".wav", "audio/wav"}, {".ogg", "audio/ogg"},
        {".flac", "audio/flac"}, {".mp4", "video/mp4"}, {".webm", "video/webm"},
        {".avi", "video/x-msvideo"}, {".mov", "video/quicktime"},
        // archives
        {".zip", "application/zip"}, {".gz", "application/gzip"}, {".tgz", "application/gzip"},
        {".tar", "application/x-tar"}, {".bz2", "application/x-bzip2"}, {".xz", "application/x-xz"},
        {".7z", "application/x-7z-compressed"}, {".rar", "application/vnd.rar"},
        // documents
        {".pdf", "application/pdf"}, {".doc", "application/msword"},
        {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
        {".xls", "application/vnd.ms-excel"},
        {".xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
        {".ppt", "application/vnd.ms-powerpoint"},
        {".pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation"},
        {".odt", "application/vnd.oasis.opendocument.text"},
        {".wasm", "application/wasm"},
    };
    return table;
}

} // namespace

std::string mimeTypeForPath(const std::string& path) {
    const auto slash = path.find_last_of("/\\");
    const std::string name = (slash == std::string::npos) ? path : path.substr(slash + 1);
    const auto dot = name.find_last_of('.');
    if (dot == std::string::npos || dot == 0) return kGenericBinaryMime;

    std::string ext = name.substr(dot);
    for (auto& c : ext) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    const auto& table = mimeTable();
    auto it = table.find(ext);
    return it != table.end() ? it->second : std::string(kGenericBinaryMime);
}

std::string effectiveMimeType(const std::string& path, bool isText) {
    std::string mime = mimeTypeForPath(path);
    if (isText && mime == kGenericBinaryMime) return kPlainTextMime;
    return mime;
}

} // namespace remotefs
