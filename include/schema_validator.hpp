#pragma once

#include <yaml-cpp/yaml.h>
#include <string>
#include <vector>

namespace epm {

struct SchemaIssue {
    size_t index;        // position of the record in the endpoint list
    std::string field;   // empty when the record itself is malformed
    std::string message;
};

// Advisory shape check of the endpoint list:
//
//   - name: <string>                 required
//     url: <string>                  required
//     method: <string>               optional
//     headers: {<string>: <any>}     optional
//     body: <string>                 optional
//
// Every issue is logged at error level; nothing is thrown and the caller
// decides what to do with flagged records.
class SchemaValidator {
public:
    static std::vector<SchemaIssue> validate(const YAML::Node& document);

private:
    static void validate_record(const YAML::Node& record, size_t index,
                                std::vector<SchemaIssue>& issues);
};

} // namespace epm
