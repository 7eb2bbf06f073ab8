#pragma once

// PQGCore - Property graph over a single SQLite relation
//
// Usage:
//   #include <PQGCore.hpp>
//
//   int main() {
//       pqg::graph g;  // in-memory, or g(pqg::configuration("graph.db"))
//
//       g.register_type({"Sample", {{"name", pqg::field_type::string},
//                                   {"site", pqg::field_type::reference}}});
//       g.register_type({"Site", {{"title", pqg::field_type::string}}});
//       g.initialize();
//
//       auto site = pqg::make_node("Site", "site:1");
//       pqg::node_object sample("Sample", "sample:1");
//       sample.set("name", "core A").link("site", site);
//       g.add_node(sample);  // two node rows and one edge
//
//       for (const auto& r : g.get_relations("sample:1")) {
//           std::cout << r.subject << " " << r.predicate << " " << r.object << std::endl;
//       }
//   }

#include "pqg/log.hpp"
#include "pqg/types.hpp"
#include "pqg/error.hpp"
#include "pqg/db.hpp"
#include "pqg/sequence.hpp"
#include "pqg/schema.hpp"
#include "pqg/identity.hpp"
#include "pqg/edge_id.hpp"
#include "pqg/object.hpp"
#include "pqg/context.hpp"
#include "pqg/edge_store.hpp"
#include "pqg/decomposer.hpp"
#include "pqg/traversal.hpp"
#include "pqg/graph.hpp"
#include "pqg/typed_edges.hpp"
