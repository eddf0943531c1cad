#include <cstdio>
#include <iostream>
#include <thread>
#include <vector>
#include "arcslot/arcslot.hpp"

// A native handle that must be closed exactly once, shared by worker threads.

struct FileCloser {
    void operator()(std::FILE* f) const noexcept {
        std::fclose(f);
        std::cout << "file closed\n";
    }
};

using NativeFile = arcslot::UniqueResource<std::FILE*, FileCloser>;
using FileHandle = arcslot::Handle<NativeFile, 1>;

int main() {
    std::FILE* raw = std::tmpfile();
    if (!raw) {
        std::cerr << "tmpfile failed\n";
        return 1;
    }

    FileHandle file = FileHandle::create_or_throw([raw] { return NativeFile(raw, FileCloser{}); });

    // The registry has room for one file only.
    std::FILE* second = std::tmpfile();
    auto none = FileHandle::create([second] { return NativeFile(second, FileCloser{}); });
    if (!none) {
        std::cout << "second file rejected, registry full\n";
        if (second) std::fclose(second);
    }

    std::vector<std::thread> workers;
    for (int w = 0; w < 4; ++w) {
        workers.emplace_back([w, mine = file] {
            for (int i = 0; i < 8; ++i) {
                std::fprintf(mine->get(), "worker %d line %d\n", w, i); // stdio locks the stream
            }
        });
    }
    for (auto& th : workers) th.join();

    std::FILE* f = file->get();
    std::rewind(f);
    int lines = 0;
    for (int c; (c = std::fgetc(f)) != EOF;) {
        if (c == '\n') ++lines;
    }
    std::cout << "lines written: " << lines << " (use_count " << file.use_count() << ")\n";

    file.reset(); // last reference, closes the file
    std::cout << "Shared resource demo done\n";
    return 0;
}
