/* Copyright (C) 2016 PuzzleFS */
#include <fcntl.h>
#include <stdlib.h>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

#include "../chunk/blob_store.h"
#include "../chunk/stream_chunker.h"

using namespace puzzlefs;
using std::cerr;
using std::cout;
using std::endl;

static const int DEFAULT_READ_SIZE = 1024 * 1024;

static void
usage(const char* prog)
{
    cerr << "Usage: " << prog << " [options] FILE..." << endl
         << endl
         << "Chunks each file with content defined chunking and reports the chunks" << endl
         << "and the dedup achieved across all the files." << endl
         << endl
         << "Options:" << endl
         << "  --profile image|conformance   chunk size profile (default image)" << endl
         << "  --algo fastcdc|rabin          boundary detection (default fastcdc)" << endl
         << "  --min N --avg N --max N       chunk sizes in bytes, override the profile" << endl
         << "  --read-size N                 bytes per read (default " << DEFAULT_READ_SIZE << ")" << endl
         << "  --quiet                       print only the summary" << endl
         << endl
         << "Environment:" << endl
         << "  PUZZLEFS_DEBUG=level          debug log level of the chunker" << endl;
}

static bool
parse_int(const char* str, int* val)
{
    char* end = 0;
    long v = strtol(str, &end, 10);
    if (!str[0] || *end || v <= 0 || v > 0x7fffffff) return false;
    *val = int(v);
    return true;
}

/**
 * chunks one file into the store, returns 0 on success.
 */
static int
chunk_file(
    const std::string& path,
    const ChunkConfig& config,
    int read_size,
    bool quiet,
    MemoryBlobStore& store,
    int64_t* total_bytes)
{
    int fd = open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        cerr << "Error: open " << path << " failed: " << strerror(errno) << endl;
        return 1;
    }

    StreamChunker chunker(config);
    std::vector<FileChunkRef> refs;
    std::vector<uint8_t> buf(read_size);
    int rc = 0;

    while (true) {
        ssize_t n = read(fd, buf.data(), buf.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            cerr << "Error: read " << path << " failed: " << strerror(errno) << endl;
            rc = 1;
            break;
        }
        if (n == 0) break;
        chunker.append(buf.data(), size_t(n));
        // hand over the chunks as they come to keep memory bounded
        ingest_chunks(chunker, store, refs);
    }
    close(fd);
    if (rc) return rc;

    chunker.finish();
    ingest_chunks(chunker, store, refs);
    *total_bytes += chunker.bytes_appended();

    if (!quiet) {
        cout << path << ": " << refs.size() << " chunks " << chunker.bytes_appended() << " bytes" << endl;
        for (const FileChunkRef& ref : refs) {
            cout << "  " << ref.offset << " " << ref.length << " " << ref.digest << endl;
        }
    }
    return 0;
}

int
main(int argc, char* argv[])
{
    ChunkConfig config = ChunkConfig::image_profile();
    int min_chunk = 0;
    int avg_chunk = 0;
    int max_chunk = 0;
    int read_size = DEFAULT_READ_SIZE;
    bool quiet = false;
    std::vector<std::string> files;

    const char* debug = getenv("PUZZLEFS_DEBUG");
    if (debug) {
        set_chunk_debug_level(atoi(debug));
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        bool has_val = i + 1 < argc;
        if (arg == "-h" || arg == "--help") {
            usage(argv[0]);
            return 0;
        } else if (arg == "--quiet") {
            quiet = true;
        } else if (arg == "--profile" && has_val) {
            std::string profile(argv[++i]);
            ChunkConfig::Algorithm algo = config.algorithm;
            if (profile == "image") {
                config = ChunkConfig::image_profile();
            } else if (profile == "conformance") {
                config = ChunkConfig::conformance_profile();
            } else {
                cerr << "Error: unknown profile '" << profile << "'" << endl;
                return 1;
            }
            config.algorithm = algo;
        } else if (arg == "--algo" && has_val) {
            try {
                config.algorithm = ChunkConfig::parse_algorithm(argv[++i]);
            } catch (const ChunkConfigError& e) {
                cerr << "Error: " << e.what() << endl;
                return 1;
            }
        } else if (arg == "--min" && has_val) {
            if (!parse_int(argv[++i], &min_chunk)) {
                cerr << "Error: bad --min " << argv[i] << endl;
                return 1;
            }
        } else if (arg == "--avg" && has_val) {
            if (!parse_int(argv[++i], &avg_chunk)) {
                cerr << "Error: bad --avg " << argv[i] << endl;
                return 1;
            }
        } else if (arg == "--max" && has_val) {
            if (!parse_int(argv[++i], &max_chunk)) {
                cerr << "Error: bad --max " << argv[i] << endl;
                return 1;
            }
        } else if (arg == "--read-size" && has_val) {
            if (!parse_int(argv[++i], &read_size)) {
                cerr << "Error: bad --read-size " << argv[i] << endl;
                return 1;
            }
        } else if (arg.size() > 1 && arg[0] == '-') {
            cerr << "Error: unknown option " << arg << endl;
            usage(argv[0]);
            return 1;
        } else {
            files.push_back(arg);
        }
    }

    if (files.empty()) {
        usage(argv[0]);
        return 1;
    }

    if (min_chunk) config.min_chunk = min_chunk;
    if (avg_chunk) config.avg_chunk = avg_chunk;
    if (max_chunk) config.max_chunk = max_chunk;
    try {
        config.validate();
    } catch (const ChunkConfigError& e) {
        cerr << "Error: " << e.what() << endl;
        return 1;
    }

    MemoryBlobStore store;
    int64_t total_bytes = 0;
    for (const std::string& path : files) {
        int rc = chunk_file(path, config, read_size, quiet, store, &total_bytes);
        if (rc) return rc;
    }

    const int64_t unique_bytes = store.stored_bytes();
    cout << "total " << total_bytes
         << " unique " << unique_bytes
         << " blobs " << store.num_blobs()
         << " dedup " << std::fixed << std::setprecision(2)
         << (unique_bytes ? double(total_bytes) / double(unique_bytes) : 1.0)
         << " (" << config << ")" << endl;
    return 0;
}
