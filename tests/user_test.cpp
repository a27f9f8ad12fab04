#include <gtest/gtest.h>
#include "common/id_generator.hpp"
#include "domain/role.hpp"
#include "domain/user.hpp"

using user_service::User;

TEST(UserTest, MakeConsumesNextId) {
  common::IdGenerator ids;
  ids.nextId();
  ids.nextId();

  auto user = User::make(ids, "x");
  EXPECT_EQ(user.id(), 3u);
  EXPECT_EQ(ids.nextId(), 4u);
}

TEST(UserTest, MakeStoresNameAsGiven) {
  common::IdGenerator ids;
  auto user = User::make(ids, "  Bob  ");
  EXPECT_EQ(user.name(), "  Bob  ");
  EXPECT_FALSE(user.email());
}

TEST(UserTest, WithEmailKeepsIdAndName) {
  common::IdGenerator ids;
  auto user = User::make(ids, "x").withEmail("a@b");

  EXPECT_EQ(user.id(), 1u);
  EXPECT_EQ(user.name(), "x");
  ASSERT_TRUE(user.email());
  EXPECT_EQ(*user.email(), "a@b");
}

TEST(UserTest, IdentifiableReportsStoredId) {
  User user(42, "Alice");
  const user_service::Identifiable& entity = user;
  EXPECT_EQ(entity.id(), 42u);
}

TEST(UserTest, Debug) {
  EXPECT_EQ(User(5, "Alice").debug(), "User{id:5,name:Alice,email:none}");
  EXPECT_EQ(User(6, "Bob", "bob@example.com").debug(),
            "User{id:6,name:Bob,email:bob@example.com}");
}

TEST(RoleTest, Names) {
  EXPECT_EQ(user_service::roleName(user_service::Role::Admin), "Admin");
  EXPECT_EQ(user_service::roleName(user_service::Role::Member), "Member");
  EXPECT_EQ(user_service::roleName(user_service::Role::Guest), "Guest");
}
