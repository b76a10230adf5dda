#ifndef MAXWEIGHTMATCHING_HASH_H
#define MAXWEIGHTMATCHING_HASH_H

#include <utility>
#include <cstddef>


struct PairHash {
    size_t operator()(const std::pair<int,int>& p) const noexcept {
        return ((size_t)p.first << 32) ^ (size_t)p.second;
    }

};


#endif //MAXWEIGHTMATCHING_HASH_H
