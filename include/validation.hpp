/**
 * @file validation.hpp
 * @brief Credential format checks applied before credentials are stored.
 */

#ifndef USAGEMONITOR_VALIDATION_HPP
#define USAGEMONITOR_VALIDATION_HPP

#include <string>

namespace umon {

/**
 * Validate an organization identifier.
 *
 * @param org_id Candidate id: 1-128 characters of `[A-Za-z0-9_-]`.
 * @throws ValidationError When the id is empty, too long, or contains other
 *         characters.
 */
void validate_org_id(const std::string &org_id);

/**
 * Validate a session token.
 *
 * @param token Candidate token: 1-4096 characters of `[A-Za-z0-9._+/=-]`.
 * @throws ValidationError When the token is empty, too long, or contains
 *         other characters.
 */
void validate_session_token(const std::string &token);

} // namespace umon

#endif // USAGEMONITOR_VALIDATION_HPP
