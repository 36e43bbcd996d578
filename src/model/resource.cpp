#include "parastore/model/resource.hpp"

namespace parastore::model {

const schema::Schema &resource_entity_schema() {
  using schema::Field;
  static const schema::Schema kSchema = [] {
    schema::Schema resource("ResourceEntity");
    resource.required("id", Field::string().min_length(1))
        .optional("name", Field::string())
        .optional("created_at", Field::timestamp())
        .optional("updated_at", Field::timestamp())
        .optional("tags", Field::array_of(Field::string()));
    return resource;
  }();
  return kSchema;
}

} // namespace parastore::model
