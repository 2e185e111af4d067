#ifndef KV_STATEMACHINE_H
#define KV_STATEMACHINE_H

#include "StateMachine.h"
#include <sstream>
#include <unordered_map>


/**
 * Key-value store driven by text commands. Keys and values are plain words.
 *
 *   GET <key>          value of <key>, or "0" if it is not set
 *   SET <key> [value]  store value (empty if omitted) and return it
 *   DELETE <key>       remove <key> if present and return the key
 *
 * Anything else returns a line starting with "Error".
 */
class KVStateMachine : public StateMachine {
  public:
    std::string apply(std::string command) override {
        std::istringstream words(command);
        std::string verb, key;
        if (!(words >> verb >> key)) {
            return "Error: expected '<GET|SET|DELETE> <key> [value]'";
        }

        if (verb == "GET") return get(key);
        if (verb == "DELETE") return erase(key);
        if (verb == "SET") {
            std::string value;
            words >> value;
            return set(key, value);
        }
        return "Error: unknown command '" + verb + "'";
    }

  private:
    std::string get(const std::string &key) const {
        auto it = store.find(key);
        return it == store.end() ? "0" : it->second;
    }

    std::string set(const std::string &key, const std::string &value) {
        store[key] = value;
        return value;
    }

    std::string erase(const std::string &key) {
        store.erase(key);
        return key;
    }

    std::unordered_map<std::string, std::string> store;
};

#endif /* !KV_STATEMACHINE_H */
