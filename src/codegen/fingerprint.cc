#include "fingerprint.h"

uint64_t template_fingerprint(const std::vector<std::string>& statics, const std::vector<std::string>& part_signatures){
    Fnv1a64 hash;
    hash.mix_value<uint64_t>(statics.size());
    for(const auto& s : statics) hash.mix_string(s);
    hash.mix_value<uint64_t>(part_signatures.size());
    for(const auto& sig : part_signatures) hash.mix_string(sig);
    return hash.value;
}
