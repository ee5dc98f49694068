#include <gtest/gtest.h>

#include "config/config_schema.hpp"
#include "server/access_gate.hpp"

namespace scriptbox::server {
namespace {

TEST(AccessGateTest, AcceptsOnlyTheConfiguredToken) {
    AccessGate gate("s3cret");
    EXPECT_TRUE(gate.IsAuthorized("s3cret"));
    EXPECT_FALSE(gate.IsAuthorized("s3cre"));
    EXPECT_FALSE(gate.IsAuthorized("s3cret!"));
    EXPECT_FALSE(gate.IsAuthorized("S3CRET"));
    EXPECT_FALSE(gate.IsAuthorized(""));
    EXPECT_FALSE(gate.UsesDefaultToken());
}

TEST(AccessGateTest, EmptyTokenDeniesEveryone) {
    AccessGate gate("");
    EXPECT_FALSE(gate.IsAuthorized(""));
    EXPECT_FALSE(gate.IsAuthorized("anything"));
}

TEST(AccessGateTest, DetectsDefaultToken) {
    AccessGate gate(config::kDefaultAdminToken);
    EXPECT_TRUE(gate.UsesDefaultToken());
    EXPECT_TRUE(gate.IsAuthorized(config::kDefaultAdminToken));
}

}  // namespace
}  // namespace scriptbox::server
