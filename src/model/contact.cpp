#include "parastore/model/contact.hpp"

#include "yaml_fields.hpp"

namespace parastore::model {

const schema::Schema &contact_card_schema() {
  using schema::Field;
  static const schema::Schema kSchema = [] {
    schema::Schema contact("ContactCard");
    contact.required("id", Field::string().starts_with("cont_"))
        .required("name", Field::string().min_length(1))
        .required("type", Field::one_of({"person", "organization"}))
        .optional("email", Field::string())
        .optional("phone", Field::string())
        .optional("company", Field::string())
        .optional("role", Field::string())
        .optional("relationship", Field::string())
        .optional("notes", Field::string())
        .required("created_at", Field::timestamp())
        .required("updated_at", Field::timestamp())
        .optional("tags", Field::array_of(Field::string()))
        .optional("projects", Field::array_of(Field::string()));
    return contact;
  }();
  return kSchema;
}

const schema::Schema &contact_index_schema() {
  using schema::Field;
  static const schema::Schema kSchema = [] {
    schema::Schema index("ContactIndex");
    index.required("version", Field::integer().min(1))
        .required("updated_at", Field::timestamp())
        .required("contacts", Field::array_of(Field::object(contact_card_schema())));
    return index;
  }();
  return kSchema;
}

} // namespace parastore::model

namespace YAML {

using namespace parastore::model::yaml_fields;

Node convert<parastore::model::ContactCard>::encode(const parastore::model::ContactCard &value) {
  Node node(NodeType::Map);
  node["id"] = value.id;
  node["name"] = value.name;
  node["type"] = value.type;
  write_optional(node, "email", value.email);
  write_optional(node, "phone", value.phone);
  write_optional(node, "company", value.company);
  write_optional(node, "role", value.role);
  write_optional(node, "relationship", value.relationship);
  write_optional(node, "notes", value.notes);
  node["created_at"] = value.created_at;
  node["updated_at"] = value.updated_at;
  write_string_list(node, "tags", value.tags);
  write_string_list(node, "projects", value.projects);
  return node;
}

bool convert<parastore::model::ContactCard>::decode(const Node &node,
                                                    parastore::model::ContactCard &value) {
  if (!node.IsMap()) {
    return false;
  }
  value = {};
  if (!read_string(node, "id", value.id) || !read_string(node, "name", value.name) ||
      !read_string(node, "type", value.type) ||
      !read_string(node, "created_at", value.created_at) ||
      !read_string(node, "updated_at", value.updated_at)) {
    return false;
  }
  read_optional(node, "email", value.email);
  read_optional(node, "phone", value.phone);
  read_optional(node, "company", value.company);
  read_optional(node, "role", value.role);
  read_optional(node, "relationship", value.relationship);
  read_optional(node, "notes", value.notes);
  read_string_list(node, "tags", value.tags);
  read_string_list(node, "projects", value.projects);
  return true;
}

} // namespace YAML
