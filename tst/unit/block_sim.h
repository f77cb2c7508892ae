//
// In-memory block store, standing in for Valkey string keys
//
#ifndef VALKEYDAGSELMODULE_TST_UNIT_BLOCK_SIM_H_
#define VALKEYDAGSELMODULE_TST_UNIT_BLOCK_SIM_H_

#include <map>
#include <set>
#include <string>
#include <string_view>
#include "dagsel/block.h"

class MapBlockSource : public BlockSource {
 public:
    MapBlockSource() : blocks(), wrongType(), denied(), numReads(0) {}

    void put(const std::string &key, const std::string &json) { blocks[key] = json; }

    // A key that exists but does not hold a string, e.g. a hash
    void putWrongType(const std::string &key) { wrongType.insert(key); }

    // A key the current user may not read
    void deny(const std::string &key) { denied.insert(key); }

    DagselCode read(const std::string_view &key, std::string_view &json) override {
        numReads++;
        std::string k(key);
        if (denied.count(k)) return DAGSEL_LINK_ACCESS_DENIED;
        if (wrongType.count(k)) return DAGSEL_NOT_A_BLOCK_KEY;
        auto it = blocks.find(k);
        if (it == blocks.end()) return DAGSEL_BLOCK_KEY_NOT_FOUND;
        json = std::string_view(it->second.c_str(), it->second.length());
        return DAGSEL_SUCCESS;
    }

    size_t getNumReads() const { return numReads; }

 private:
    std::map<std::string, std::string> blocks;
    std::set<std::string> wrongType;
    std::set<std::string> denied;
    size_t numReads;
};

#endif  // VALKEYDAGSELMODULE_TST_UNIT_BLOCK_SIM_H_
