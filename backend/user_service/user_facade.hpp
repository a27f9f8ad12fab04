#pragma once
#include <memory>
#include <string>
#include "common/id_generator.hpp"
#include "domain/user.hpp"

namespace user_service {

// Creates a user through a throwaway UserService. Ids come from the
// caller's generator, so repeated calls never collide.
User createUser(std::shared_ptr<common::IdGenerator> ids, const std::string& name);

}
