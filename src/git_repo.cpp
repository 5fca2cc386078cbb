#include "git_repo.hpp"
#include <git2.h>

static std::string lastGitError(const char* what)
{
    const git_error* err = git_error_last();
    std::string message = what;
    message += ": ";
    message += (err != nullptr && err->message != nullptr) ? err->message : "unknown libgit2 error";
    return message;
}

static std::string oidToHex(const git_oid* oid)
{
    char hex[GIT_OID_HEXSZ + 1];
    git_oid_tostr(hex, sizeof(hex), oid);
    return std::string(hex);
}

GitRepository::GitRepository()
    : repo_(nullptr), initialized_(git_libgit2_init() > 0)
{
}

GitRepository::~GitRepository()
{
    git_repository_free(repo_);
    if (initialized_) {
        git_libgit2_shutdown();
    }
}

bool GitRepository::open(const std::string& path, std::string& error)
{
    git_repository_free(repo_);
    repo_ = nullptr;

    if (!initialized_) {
        error = "libgit2 failed to initialize";
        return false;
    }
    if (git_repository_open_ext(&repo_, path.c_str(), 0, nullptr) != 0) {
        repo_ = nullptr;
        error = lastGitError(("open repository '" + path + "'").c_str());
        return false;
    }
    return true;
}

bool GitRepository::readHead(std::string& headId, ObjectBuffer& object, std::string& error)
{
    if (repo_ == nullptr) {
        error = "repository is not open";
        return false;
    }

    git_oid oid;
    if (git_reference_name_to_id(&oid, repo_, "HEAD") != 0) {
        error = lastGitError("rev-parse HEAD");
        return false;
    }

    git_odb* odb = nullptr;
    if (git_repository_odb(&odb, repo_) != 0) {
        error = lastGitError("open object database");
        return false;
    }

    git_odb_object* raw = nullptr;
    if (git_odb_read(&raw, odb, &oid) != 0) {
        error = lastGitError("read HEAD object");
        git_odb_free(odb);
        return false;
    }

    bool ok = true;
    if (git_odb_object_type(raw) != GIT_OBJECT_COMMIT) {
        error = "HEAD does not point at a commit";
        ok = false;
    } else {
        const char* data = static_cast<const char*>(git_odb_object_data(raw));
        object = ObjectBuffer::fromContent("commit", std::string(data, git_odb_object_size(raw)));
        headId = oidToHex(&oid);
    }

    git_odb_object_free(raw);
    git_odb_free(odb);
    return ok;
}

bool GitRepository::writeObject(const ObjectBuffer& object, std::string& id, std::string& error)
{
    if (repo_ == nullptr) {
        error = "repository is not open";
        return false;
    }

    const git_object_t type = git_object_string2type(object.type().c_str());
    if (type == GIT_OBJECT_INVALID) {
        error = "unknown object type '" + object.type() + "'";
        return false;
    }

    git_odb* odb = nullptr;
    if (git_repository_odb(&odb, repo_) != 0) {
        error = lastGitError("open object database");
        return false;
    }

    git_oid oid;
    const int rc = git_odb_write(&oid, odb, object.contentData(), object.contentSize(), type);
    git_odb_free(odb);
    if (rc != 0) {
        error = lastGitError("hash-object");
        return false;
    }

    id = oidToHex(&oid);
    return true;
}

bool GitRepository::updateHead(const std::string& id, const std::string& reflogMessage,
                               std::string& error)
{
    if (repo_ == nullptr) {
        error = "repository is not open";
        return false;
    }

    git_oid oid;
    if (git_oid_fromstr(&oid, id.c_str()) != 0) {
        error = lastGitError(("parse object id '" + id + "'").c_str());
        return false;
    }

    // Resolves HEAD to the branch it refers to, or HEAD itself if detached
    git_reference* head = nullptr;
    if (git_repository_head(&head, repo_) != 0) {
        error = lastGitError("resolve HEAD");
        return false;
    }

    git_reference* updated = nullptr;
    const int rc = git_reference_set_target(&updated, head, &oid, reflogMessage.c_str());
    git_reference_free(head);
    if (rc != 0) {
        error = lastGitError("update-ref");
        return false;
    }

    git_reference_free(updated);
    return true;
}
