#pragma once

#include "navigator/traversal_policy.hpp"
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace atlas {

/**
 * @brief Raised when a named policy does not exist
 *
 * The message names the requested policy and lists every valid name.
 */
class PolicyNotFoundError : public std::out_of_range {
public:
    PolicyNotFoundError(const std::string& requested, std::vector<std::string> available);

    const std::string& requested() const { return requested_; }
    const std::vector<std::string>& available() const { return available_; }

private:
    std::string requested_;
    std::vector<std::string> available_;

    static std::string build_message(const std::string& requested,
                                     const std::vector<std::string>& available);
};

/**
 * @brief Look up a named traversal policy
 * @throws PolicyNotFoundError for an unknown name
 */
TraversalPolicy get_named_policy(const std::string& name);

bool has_named_policy(const std::string& name);

// Policy name -> description, ordered by name
std::map<std::string, std::string> list_named_policies();

}  // namespace atlas
