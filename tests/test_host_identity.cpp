#include <gtest/gtest.h>

#include "remotix/HostIdentity.hpp"

using remotix::HostIdentity;

TEST(host_identity, default_port_folds_to_bare_host) {
    EXPECT_EQ(HostIdentity::make("example.com", 22).key(), "example.com");
}

TEST(host_identity, other_ports_use_bracket_form) {
    EXPECT_EQ(HostIdentity::make("example.com", 2222).key(), "[example.com]:2222");
    EXPECT_NE(HostIdentity::make("example.com", 22).key(), HostIdentity::make("example.com", 2222).key());
}

TEST(host_identity, host_is_trimmed_and_lowercased) {
    const HostIdentity id = HostIdentity::make("  Example.COM \t", 22);
    EXPECT_EQ(id.host, "example.com");
    EXPECT_EQ(id, HostIdentity::make("example.com", 22));
}

TEST(host_identity, ipv6_literal_with_custom_port) {
    EXPECT_EQ(HostIdentity::make("::1", 2200).key(), "[::1]:2200");
}
