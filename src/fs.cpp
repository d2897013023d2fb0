#include "fs.h"
#include "logger.h"
#include <cstdio>
#include <sys/stat.h>

#ifdef _WIN32
    #include <direct.h>
    #include <io.h>
    #define stat _stat
    #define access _access
    #define F_OK 0
#else
    #include <unistd.h>
#endif

// Filesystem module logging macros
#define LOG_FS_ERROR(message) LOG_ERROR("fs", message)

namespace peerdrop {

namespace {

bool stat_mode(const std::string& path, unsigned int& mode) {
    struct stat st;
    if (path.empty() || stat(path.c_str(), &st) != 0) {
        return false;
    }
    mode = static_cast<unsigned int>(st.st_mode);
    return true;
}

bool make_directory(const std::string& path) {
#ifdef _WIN32
    return _mkdir(path.c_str()) == 0;
#else
    return mkdir(path.c_str(), 0755) == 0;
#endif
}

} // namespace

bool file_exists(const std::string& path) {
    return !path.empty() && access(path.c_str(), F_OK) == 0;
}

bool directory_exists(const std::string& path) {
    unsigned int mode = 0;
    return stat_mode(path, mode) && (mode & S_IFDIR) != 0;
}

bool is_file(const std::string& path) {
    unsigned int mode = 0;
    return stat_mode(path, mode) && (mode & S_IFREG) != 0;
}

bool create_file(const std::string& path, const std::string& content) {
    return create_file_binary(path, content.data(), content.size());
}

bool create_file_binary(const std::string& path, const void* data, size_t size) {
    std::vector<std::vector<uint8_t>> segments;
    if (data && size > 0) {
        const uint8_t* bytes = static_cast<const uint8_t*>(data);
        segments.emplace_back(bytes, bytes + size);
    }
    return write_file_segments(path, segments);
}

bool write_file_segments(const std::string& path, const std::vector<std::vector<uint8_t>>& segments) {
    FILE* file = fopen(path.c_str(), "wb");
    if (!file) {
        LOG_FS_ERROR("Failed to create file: " << path);
        return false;
    }

    for (const auto& segment : segments) {
        if (segment.empty()) {
            continue;
        }
        if (fwrite(segment.data(), 1, segment.size(), file) != segment.size()) {
            LOG_FS_ERROR("Failed to write " << segment.size() << " bytes to " << path);
            fclose(file);
            remove(path.c_str());
            return false;
        }
    }

    if (fclose(file) != 0) {
        LOG_FS_ERROR("Failed to flush file: " << path);
        remove(path.c_str());
        return false;
    }
    return true;
}

std::optional<std::string> read_file_text(const std::string& path) {
    FILE* file = fopen(path.c_str(), "rb");
    if (!file) {
        LOG_FS_ERROR("Failed to open file for reading: " << path);
        return std::nullopt;
    }

    std::string content;
    char buffer[4096];
    size_t read = 0;
    while ((read = fread(buffer, 1, sizeof(buffer), file)) > 0) {
        content.append(buffer, read);
    }
    bool failed = ferror(file) != 0;
    fclose(file);

    if (failed) {
        LOG_FS_ERROR("Failed to read file: " << path);
        return std::nullopt;
    }
    return content;
}

int64_t read_file_chunk(const std::string& path, uint64_t offset, void* buffer, size_t size) {
    if (!buffer) return -1;

    FILE* file = fopen(path.c_str(), "rb");
    if (!file) {
        LOG_FS_ERROR("Failed to open file for chunk reading: " << path);
        return -1;
    }

#ifdef _WIN32
    int seek_result = _fseeki64(file, static_cast<__int64>(offset), SEEK_SET);
#else
    int seek_result = fseeko(file, static_cast<off_t>(offset), SEEK_SET);
#endif
    if (seek_result != 0) {
        LOG_FS_ERROR("Failed to seek to offset " << offset << " in " << path);
        fclose(file);
        return -1;
    }

    size_t bytes_read = fread(buffer, 1, size, file);
    bool failed = ferror(file) != 0;
    fclose(file);

    if (failed) {
        LOG_FS_ERROR("Failed to read chunk at offset " << offset << " from " << path);
        return -1;
    }
    return static_cast<int64_t>(bytes_read);
}

bool create_directories(const std::string& path) {
    if (path.empty()) return false;
    if (directory_exists(path)) return true;

    for (size_t i = 1; i < path.size(); i++) {
        if (path[i] != '/' && path[i] != '\\') {
            continue;
        }
        std::string parent = path.substr(0, i);
        if (!directory_exists(parent) && !make_directory(parent)) {
            LOG_FS_ERROR("Failed to create directory: " << parent);
            return false;
        }
    }

    if (!directory_exists(path) && !make_directory(path)) {
        LOG_FS_ERROR("Failed to create directory: " << path);
        return false;
    }
    return true;
}

int64_t get_file_size(const std::string& path) {
    struct stat st;
    if (path.empty() || stat(path.c_str(), &st) != 0) {
        return -1;
    }
    return static_cast<int64_t>(st.st_size);
}

bool delete_file(const std::string& path) {
    return !path.empty() && remove(path.c_str()) == 0;
}

std::string get_filename_from_path(const std::string& path) {
    size_t pos = path.find_last_of("/\\");
    if (pos == std::string::npos) {
        return path;
    }
    return path.substr(pos + 1);
}

std::string get_file_extension(const std::string& path) {
    std::string name = get_filename_from_path(path);

    size_t pos = name.find_last_of('.');
    // A leading dot names a hidden file, not an extension
    if (pos == std::string::npos || pos == 0) {
        return "";
    }
    return name.substr(pos);
}

std::string get_file_stem(const std::string& path) {
    std::string name = get_filename_from_path(path);
    return name.substr(0, name.size() - get_file_extension(name).size());
}

std::string combine_paths(const std::string& base, const std::string& relative) {
    if (base.empty()) return relative;
    if (relative.empty()) return base;

    char last = base.back();
    if (last == '/' || last == '\\') {
        return base + relative;
    }
    return base + "/" + relative;
}

} // namespace peerdrop
