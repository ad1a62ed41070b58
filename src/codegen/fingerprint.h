#pragma once

#include <cstdint>
#include <string>
#include <vector>

// 64-bit FNV-1a over the static skeleton of a template
struct Fnv1a64 {
    uint64_t value = 1469598103934665603ull;

    void mix_bytes(const void* data, size_t size){
        auto bytes = static_cast<const unsigned char*>(data);
        for(size_t i = 0; i < size; ++i){
            value ^= static_cast<uint64_t>(bytes[i]);
            value *= 1099511628211ull;
        }
    }

    template <typename T>
    void mix_value(const T& v){
        mix_bytes(&v, sizeof(T));
    }

    void mix_string(const std::string& s){
        mix_value<uint64_t>(s.size());
        mix_bytes(s.data(), s.size());
    }
};

// Depends on the statics and on what each dynamic part reads and calls, never on values.
// Two templates that only differ in their expressions must not share a fingerprint:
// a render reuses the previous tree of an equal fingerprint as its own.
uint64_t template_fingerprint(const std::vector<std::string>& statics, const std::vector<std::string>& part_signatures);
