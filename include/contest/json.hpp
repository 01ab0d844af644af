#pragma once

#include <nlohmann/json.hpp>
#include "contest/contest.hpp"
#include "contest/contest_result.hpp"

namespace arena {

/**
 * @code{.json}
 * {
 *     "id": "weekly-1",
 *     "title": "Weekly Contest 1",
 *     "start_time": 1700000000000,
 *     "duration_ms": 3600000,
 *     "problems": [ { "problem_id": "two-sum", "order": 1, "points": 100 } ]
 * }
 * @endcode
 */
void from_json(const nlohmann::json &j, contest &value);
void to_json(nlohmann::json &j, const contest &value);

void from_json(const nlohmann::json &j, problem_result &value);
void to_json(nlohmann::json &j, const problem_result &value);

void from_json(const nlohmann::json &j, contest_result &value);
void to_json(nlohmann::json &j, const contest_result &value);

}  // namespace arena
