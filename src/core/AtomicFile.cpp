#include "core/AtomicFile.h"
#include <fstream>
#include <system_error>

namespace {
    bool write_temp_and_flush(const std::filesystem::path& temp, std::string_view bytes, std::string* err) {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            if (err) *err = "cannot create " + temp.string();
            return false;
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out) {
            if (err) *err = "write failed: " + temp.string();
            return false;
        }
        return true;
    }
}

namespace brazier::io {
    bool write_atomic(const fs::path& path, std::string_view bytes, std::string* err)
    {
        std::error_code ec;
        if (path.has_parent_path())
            fs::create_directories(path.parent_path(), ec);

        auto tmp = path; tmp += ".tmp";

        if (!write_temp_and_flush(tmp, bytes, err)) {
            fs::remove(tmp, ec);
            return false;
        }

        // rename() replaces an existing destination atomically on POSIX filesystems.
        fs::rename(tmp, path, ec);
        if (ec) {
            if (err) *err = "rename failed: " + ec.message();
            std::error_code rm;
            fs::remove(tmp, rm);
            return false;
        }
        return true;
    }

    bool read_all(const fs::path& p, std::string& out, std::string* err) {
        std::ifstream in(p, std::ios::binary);
        if (!in) { if (err) *err = "open failed"; return false; }
        in.seekg(0, std::ios::end);
        auto sz = in.tellg();
        if (sz < 0) { if (err) *err = "seek failed"; return false; }
        in.seekg(0, std::ios::beg);
        out.resize(static_cast<size_t>(sz));
        if (sz > 0) in.read(out.data(), sz);
        return true;
    }
}
