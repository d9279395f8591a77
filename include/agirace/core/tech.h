#pragma once

#include <string>
#include <vector>

#include "agirace/core/game_state.h"

namespace agirace {

// Loads the action catalog and faction templates (see data/content/catalog.json).
// Throws std::runtime_error (or std::invalid_argument for unknown enum strings)
// on malformed content.
ContentDB load_content_db_from_file(const std::string& path);

// Loads the tech DAG in catalog order (see data/content/tech_tree.json).
std::vector<TechNode> load_tech_db_from_file(const std::string& path);

// Convenience: catalog + tech tree from the shipped data files.
ContentDB load_default_content();

} // namespace agirace
