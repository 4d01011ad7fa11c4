#include "selection/Candidate.h"
#include <system_error>

Candidate::Candidate(fs::path path) : path(std::move(path)) {}

std::string Candidate::getExtension() const {
    std::string ext = path.filename().extension().string();
    if (ext == ".") return "";
    return ext;
}

std::optional<std::uintmax_t> Candidate::getSizeBytes() const {
    if (!sizeRead) {
        sizeRead = true;
        std::error_code ec;
        std::uintmax_t size = fs::file_size(path, ec);
        if (!ec) sizeBytes = size;
    }
    return sizeBytes;
}

std::optional<fs::file_time_type> Candidate::getLastModified() const {
    if (!mtimeRead) {
        mtimeRead = true;
        std::error_code ec;
        fs::file_time_type mtime = fs::last_write_time(path, ec);
        if (!ec) lastModified = mtime;
    }
    return lastModified;
}
