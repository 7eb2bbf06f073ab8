#pragma once

#include <PQGCore.hpp>
#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

namespace test_support {

/// True if `fn` throws E. Any other exception propagates to main.
template<typename E, typename F>
bool throws(F&& fn) {
    try {
        fn();
    } catch (const E&) {
        return true;
    }
    return false;
}

/// In-memory configuration whose clock ticks once per read.
inline pqg::configuration ticking_config(int64_t start = 1000) {
    pqg::configuration config;
    auto counter = std::make_shared<int64_t>(start);
    config.clock = [counter]() { return (*counter)++; };
    return config;
}

inline std::string temp_db_path(const std::string& name) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove(path);
    std::filesystem::remove(path.string() + "-wal");
    std::filesystem::remove(path.string() + "-shm");
    return path.string();
}

inline void remove_db(const std::string& path) {
    std::filesystem::remove(path);
    std::filesystem::remove(path + "-wal");
    std::filesystem::remove(path + "-shm");
}

inline void register_people(pqg::graph& g) {
    using pqg::field_type;
    g.register_type({"Person", {
        {"name", field_type::string},
        {"age", field_type::integer},
        {"score", field_type::double_},
        {"active", field_type::boolean},
        {"born", field_type::timestamp},
        {"nicknames", field_type::string_list},
        {"lucky", field_type::integer_list},
        {"weights", field_type::double_list},
        {"photo", field_type::blob},
        {"friend", field_type::reference},
        {"pets", field_type::reference_list},
    }});
    g.register_type({"Pet", {
        {"name", field_type::string},
        {"owner", field_type::reference},
    }});
}

inline void register_things(pqg::graph& g) {
    using pqg::field_type;
    g.register_type({"Thing", {
        {"title", field_type::string},
        {"next", field_type::reference},
        {"left", field_type::reference},
        {"right", field_type::reference},
        {"parts", field_type::reference_list},
    }});
}

/// Graph with Person, Pet and Thing registered and initialized.
inline std::unique_ptr<pqg::graph> make_graph(pqg::configuration config = ticking_config()) {
    auto g = std::make_unique<pqg::graph>(std::move(config));
    register_people(*g);
    register_things(*g);
    g->initialize();
    return g;
}

/// Plain node with no fields.
inline std::string add_thing(pqg::graph& g, const std::string& pid, const std::string& title = "") {
    pqg::node_object thing("Thing", pid);
    if (!title.empty()) thing.set("title", title);
    return g.add_node(thing);
}

} // namespace test_support
