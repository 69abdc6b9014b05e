#pragma once
// Abstract gzip line reader, keeping rapidgzip out of every TU but one.
//
// GzLineReaderRapidgzip lives in src/table_io_backend.cpp, the only
// translation unit that includes rapidgzip headers. Without HAVE_RAPIDGZIP
// the factory returns nullptr and table_io falls back to zlib.

#include <cstddef>
#include <memory>
#include <string>

namespace kinswing {

class GzLineReader {
public:
    static constexpr size_t GZBUF_SIZE = 1024 * 1024;  // 1 MB

    virtual ~GzLineReader() = default;

    // Read one line without the trailing newline. Returns false on EOF.
    virtual bool readline(std::string& line) = 0;
};

// True when the file starts with the gzip magic bytes
bool is_gzip_file(const std::string& path);

std::unique_ptr<GzLineReader> make_gz_reader(const std::string& path);

}  // namespace kinswing
