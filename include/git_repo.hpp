#pragma once

#include "object_buffer.hpp"
#include <string>

// =============================================================================
// GIT REPOSITORY - libgit2 access to HEAD, the object database and refs
// =============================================================================

struct git_repository;

class GitRepository {
public:
    GitRepository();
    ~GitRepository();

    GitRepository(const GitRepository&) = delete;
    GitRepository& operator=(const GitRepository&) = delete;

    bool open(const std::string& path, std::string& error);
    bool isOpen() const { return repo_ != nullptr; }

    // HEAD's commit id and the commit object framed as "commit <len>\0..."
    bool readHead(std::string& headId, ObjectBuffer& object, std::string& error);

    // Store the object's content under its type; returns the new id
    bool writeObject(const ObjectBuffer& object, std::string& id, std::string& error);

    // Point HEAD (the branch it refers to, or HEAD itself when detached) at id
    bool updateHead(const std::string& id, const std::string& reflogMessage,
                    std::string& error);

private:
    git_repository* repo_;
    bool initialized_;
};
