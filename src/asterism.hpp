#pragma once
// Object-graph mapping over an asterism graph store.
#include "client.hpp"
#include "connection.hpp"
#include "errors.hpp"
#include "index.hpp"
#include "node.hpp"
#include "node_index.hpp"
#include "property.hpp"
#include "query.hpp"
#include "relationship.hpp"
#include "schema.hpp"
#include "value.hpp"
