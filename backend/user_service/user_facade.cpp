#include "user_facade.hpp"
#include "application/user_service.hpp"

namespace user_service {

User createUser(std::shared_ptr<common::IdGenerator> ids, const std::string& name) {
  UserService service(ids);
  return service.create(name);
}

}
