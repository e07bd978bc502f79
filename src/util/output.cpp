#include <plume/output.hpp>
#include <filesystem>
#include <fstream>

namespace plume {

namespace fs = std::filesystem;

Status write_file_atomic(const std::string& path, const std::string& text) {
    fs::path target(path);
    fs::path tmp = target;
    tmp += ".plume-tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return PlumeError{PlumeError::IO, "could not create " + tmp.string()};
        }
        out << text;
        // close() flushes; a failed flush only shows up here
        out.close();
        if (out.fail()) {
            std::error_code rm_ec;
            fs::remove(tmp, rm_ec);
            return PlumeError{PlumeError::IO, "could not write " + tmp.string()};
        }
    }
    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec) {
        std::error_code rm_ec;
        fs::remove(tmp, rm_ec);
        return PlumeError{PlumeError::IO,
            "could not move output into place: " + path, ec.message()};
    }
    return ok_status();
}

} // namespace plume
