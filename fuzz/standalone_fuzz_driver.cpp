// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license
// Corpus replay driver for builds without libFuzzer (gcc, CI boxes)
//
//   fuzz_multiaddr corpus/multiaddr crash-1234
//
// Every argument is a file or a directory; directories are walked
// recursively and every regular file in them is replayed once, in sorted
// order so runs are reproducible. An input that trips an invariant traps
// inside the harness, so reaching the summary means the corpus is clean.

#ifdef STANDALONE_FUZZ_TARGET_DRIVER

#include "util/files.hpp"
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size);

namespace {

// libFuzzer's default -max_len is far below this; larger files are not inputs
constexpr size_t MAX_INPUT_SIZE = 1024 * 1024;

bool CollectInputs(const std::filesystem::path &root,
                   std::vector<std::filesystem::path> &out) {
    std::error_code ec;
    if (std::filesystem::is_regular_file(root, ec)) {
        out.push_back(root);
        return true;
    }
    if (!std::filesystem::is_directory(root, ec)) {
        fprintf(stderr, "Error: '%s' is neither a file nor a directory\n",
                root.string().c_str());
        return false;
    }
    for (std::filesystem::recursive_directory_iterator it(root, ec), end;
         !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec)) {
            out.push_back(it->path());
        }
    }
    if (ec) {
        fprintf(stderr, "Error: cannot walk '%s': %s\n", root.string().c_str(),
                ec.message().c_str());
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char **argv) {
    if (argc < 2) {
        fprintf(stderr, "Usage: %s <file-or-corpus-dir>...\n", argv[0]);
        fprintf(stderr, "Configure with clang and -DTORLINK_BUILD_FUZZ=ON to fuzz.\n");
        return 1;
    }

    std::vector<std::filesystem::path> inputs;
    for (int i = 1; i < argc; ++i) {
        if (!CollectInputs(argv[i], inputs)) {
            return 1;
        }
    }
    std::sort(inputs.begin(), inputs.end());

    size_t replayed = 0;
    size_t skipped = 0;
    size_t rejected = 0;
    size_t bytes = 0;
    for (const auto &path : inputs) {
        auto data = torlink::util::read_file_string(path, MAX_INPUT_SIZE);
        if (!data) {
            fprintf(stderr, "Skipping %s: unreadable or over %zu bytes\n",
                    path.string().c_str(), MAX_INPUT_SIZE);
            ++skipped;
            continue;
        }
        // -1 asks libFuzzer to keep the input out of the corpus
        if (LLVMFuzzerTestOneInput(
                reinterpret_cast<const uint8_t *>(data->data()), data->size()) != 0) {
            ++rejected;
        }
        ++replayed;
        bytes += data->size();
    }

    printf("Replayed %zu inputs (%zu bytes), rejected %zu, skipped %zu\n",
           replayed, bytes, rejected, skipped);
    return replayed == 0 ? 1 : 0;
}

#endif // STANDALONE_FUZZ_TARGET_DRIVER
