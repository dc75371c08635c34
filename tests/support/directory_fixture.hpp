#pragma once

/// @file directory_fixture.hpp
/// @brief Seeds an InMemoryDirectory with a small, fixed population.
///
/// | id | username | email             | secret       | roles  | active |
/// |----|----------|-------------------|--------------|--------|--------|
/// | 1  | alice    | alice@example.com | alice-secret | reader | yes    |
/// | 2  | bob      | bob@example.com   | bob-secret   | reader | yes    |
/// | 3  | carol    | carol@example.com | carol-secret | reader | no     |
/// | 9  | root     | root@example.com  | root-secret  | admin  | yes    |
///
/// reader grants users:read; admin grants users:read, users:write and
/// sessions:manage.

#include <gtest/gtest.h>

#include <string>

#include "cas/service/credential_verifier.hpp"
#include "cas/service/directory.hpp"

namespace cas::test {

inline void seedDirectory(cas::service::InMemoryDirectory& directory,
                          const cas::service::ICredentialVerifier& credentials) {
    using namespace cas::service;

    auto addPermission = [&](const std::string& resource, const std::string& action) {
        auto name = resource + ":" + action;
        ASSERT_TRUE(directory
                        .addPermission(Permission{PermissionId(name), name, resource, action,
                                                  "grants " + name})
                        .hasValue());
    };
    addPermission("users", "read");
    addPermission("users", "write");
    addPermission("sessions", "manage");

    ASSERT_TRUE(directory.addRole(Role{RoleId("reader"), "reader", "Read-only", {}, false})
                    .hasValue());
    ASSERT_TRUE(directory.addRole(Role{RoleId("admin"), "admin", "Administrator", {}, false})
                    .hasValue());
    ASSERT_TRUE(directory.assignPermission(RoleId("reader"), PermissionId("users:read"))
                    .hasValue());
    for (const char* perm : {"users:read", "users:write", "sessions:manage"}) {
        ASSERT_TRUE(directory.assignPermission(RoleId("admin"), PermissionId(perm)).hasValue());
    }

    auto addPrincipal = [&](const std::string& id, const std::string& username, bool active,
                            const std::string& role) {
        Principal p;
        p.id = PrincipalId(id);
        p.username = username;
        p.email = username + "@example.com";
        p.secretHash = credentials.hashSecret(username + "-secret");
        p.active = active;
        ASSERT_TRUE(directory.addPrincipal(p).hasValue());
        ASSERT_TRUE(directory.assignRole(p.id, RoleId(role)).hasValue());
    };
    addPrincipal("1", "alice", true, "reader");
    addPrincipal("2", "bob", true, "reader");
    addPrincipal("3", "carol", false, "reader");
    addPrincipal("9", "root", true, "admin");
}

}  // namespace cas::test
