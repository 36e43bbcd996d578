#pragma once

#include "parastore/schema/schema.hpp"

namespace parastore::model {

// Notes, templates, procedures and preferences carry free-form bodies; only
// the identity and timestamps are constrained.
[[nodiscard]] const schema::Schema &resource_entity_schema();

} // namespace parastore::model
