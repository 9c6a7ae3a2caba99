#include "MimeTypes.hpp"

#include "Rules.hpp"

#include <string_view>
#include <unordered_map>

namespace {
const std::unordered_map<std::string_view, std::string_view>& mimeTable() {
    static const std::unordered_map<std::string_view, std::string_view> table{
        // images
        {".jpg", "image/jpeg"}, {".jpeg", "image/jpeg"}, {".jpe", "image/jpeg"},
        {".png", "image/png"}, {".gif", "image/gif"}, {".bmp", "image/bmp"},
        {".webp", "image/webp"}, {".svg", "image/svg+xml"}, {".tif", "image/tiff"},
        {".tiff", "image/tiff"}, {".ico", "image/vnd.microsoft.icon"}, {".heic", "image/heic"},
        {".avif", "image/avif"},
        // audio
        {".mp3", "audio/mpeg"}, {".wav", "audio/x-wav"}, {".flac", "audio/flac"},
        {".ogg", "audio/ogg"}, {".oga", "audio/ogg"}, {".m4a", "audio/mp4"},
        {".aac", "audio/aac"}, {".opus", "audio/opus"}, {".mid", "audio/midi"},
        {".midi", "audio/midi"},
        // video
        {".mp4", "video/mp4"}, {".m4v", "video/mp4"}, {".mkv", "video/x-matroska"},
        {".mov", "video/quicktime"}, {".avi", "video/x-msvideo"}, {".webm", "video/webm"},
        {".mpeg", "video/mpeg"}, {".mpg", "video/mpeg"}, {".wmv", "video/x-ms-wmv"},
        {".flv", "video/x-flv"},
        // text and code
        {".txt", "text/plain"}, {".text", "text/plain"}, {".log", "text/plain"},
        {".md", "text/markdown"}, {".csv", "text/csv"}, {".tsv", "text/tab-separated-values"},
        {".html", "text/html"}, {".htm", "text/html"}, {".css", "text/css"},
        {".js", "text/javascript"}, {".mjs", "text/javascript"}, {".xml", "text/xml"},
        {".c", "text/x-c"}, {".h", "text/x-c"}, {".cpp", "text/x-c++"},
        {".hpp", "text/x-c++"}, {".py", "text/x-python"}, {".sh", "application/x-sh"},
        {".json", "application/json"}, {".yaml", "application/yaml"}, {".yml", "application/yaml"},
        // documents
        {".pdf", "application/pdf"}, {".rtf", "application/rtf"},
        {".doc", "application/msword"},
        {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
        {".xls", "application/vnd.ms-excel"},
        {".xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
        {".ppt", "application/vnd.ms-powerpoint"},
        {".pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation"},
        {".odt", "application/vnd.oasis.opendocument.text"},
        {".ods", "application/vnd.oasis.opendocument.spreadsheet"},
        {".epub", "application/epub+zip"},
        // archives and binaries
        {".zip", "application/zip"}, {".tar", "application/x-tar"},
        {".7z", "application/x-7z-compressed"}, {".rar", "application/vnd.rar"},
        {".iso", "application/x-iso9660-image"}, {".exe", "application/x-msdownload"},
        {".msi", "application/x-msi"}, {".deb", "application/vnd.debian.binary-package"},
        {".apk", "application/vnd.android.package-archive"}, {".wasm", "application/wasm"},
        // fonts
        {".ttf", "font/ttf"}, {".otf", "font/otf"}, {".woff", "font/woff"}, {".woff2", "font/woff2"},
    };
    return table;
}
// Compressed-tarball shorthands expanded before the encoding suffix is stripped.
const std::unordered_map<std::string_view, std::string_view>& suffixAliases() {
    static const std::unordered_map<std::string_view, std::string_view> aliases{
        {".svgz", ".svg.gz"}, {".tgz", ".tar.gz"}, {".taz", ".tar.gz"},
        {".tz", ".tar.gz"}, {".tbz2", ".tar.bz2"}, {".txz", ".tar.xz"},
    };
    return aliases;
}

// Content encodings; the type of "x.txt.gz" is the type of "x.txt".
bool isEncodingSuffix(const std::string& extension) {
    return extension == ".gz" || extension == ".bz2" || extension == ".xz" || extension == ".br" ||
           extension == ".z";
}
} // namespace

std::optional<std::string> guessMimeType(const std::filesystem::path& file) {
    std::filesystem::path name = file.filename();
    std::string extension = normalizeExtension(name.extension().string());

    if (auto alias = suffixAliases().find(extension); alias != suffixAliases().end()) {
        name = name.stem().string() + std::string(alias->second);
        extension = normalizeExtension(name.extension().string());
    }
    if (isEncodingSuffix(extension)) {
        name = name.stem();
        extension = normalizeExtension(name.extension().string());
    }
    if (extension.empty()) {
        return std::nullopt;
    }

    const auto& table = mimeTable();
    auto it = table.find(extension);
    if (it == table.end()) {
        return std::nullopt;
    }
    return std::string(it->second);
}
