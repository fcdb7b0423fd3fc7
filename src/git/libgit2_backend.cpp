#include "libgit2_backend.hpp"
#include <core/log.hpp>
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <git2.h>
#include <fmt/format.h>
#include <cctype>

namespace {

// ── libgit2 plumbing ────────────────────────────────────────

struct LibraryInit {
    LibraryInit() { git_libgit2_init(); }
    ~LibraryInit() { git_libgit2_shutdown(); }
};

void ensure_library() {
    static LibraryInit init;
}

template <typename T, void (*Free)(T*)>
struct Closer {
    void operator()(T* p) const {
        if (p) Free(p);
    }
};

template <typename T, void (*Free)(T*)>
using GitPtr = std::unique_ptr<T, Closer<T, Free>>;

using ObjectPtr    = GitPtr<git_object, git_object_free>;
using CommitPtr    = GitPtr<git_commit, git_commit_free>;
using TreePtr      = GitPtr<git_tree, git_tree_free>;
using EntryPtr     = GitPtr<git_tree_entry, git_tree_entry_free>;
using BlobPtr      = GitPtr<git_blob, git_blob_free>;
using IndexPtr     = GitPtr<git_index, git_index_free>;
using RefPtr       = GitPtr<git_reference, git_reference_free>;
using RemotePtr    = GitPtr<git_remote, git_remote_free>;
using SigPtr       = GitPtr<git_signature, git_signature_free>;
using WalkPtr      = GitPtr<git_revwalk, git_revwalk_free>;
using StatusPtr    = GitPtr<git_status_list, git_status_list_free>;
using PackPtr      = GitPtr<git_packbuilder, git_packbuilder_free>;
using OdbPtr       = GitPtr<git_odb, git_odb_free>;
using BranchIter   = GitPtr<git_branch_iterator, git_branch_iterator_free>;

std::string last_error() {
    const git_error* e = git_error_last();
    return (e && e->message) ? e->message : "unknown libgit2 error";
}

bool mentions(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

GitErrorKind classify_error(int code) {
    const git_error* e = git_error_last();
    int klass = e ? e->klass : 0;
    std::string msg = (e && e->message) ? e->message : "";

    if (code == GIT_EAUTH) return GitErrorKind::Auth;
    if (code == GIT_ENOTFOUND || code == GIT_EUNBORNBRANCH) return GitErrorKind::NotFound;
    if (code == GIT_ENONFASTFORWARD) return GitErrorKind::Rejected;
    if (code == GIT_ECONFLICT || code == GIT_EUNMERGED || code == GIT_ELOCKED) {
        return GitErrorKind::Conflict;
    }
    if (mentions(msg, "401") || mentions(msg, "403") || mentions(msg, "authentication")) {
        return GitErrorKind::Auth;
    }
    if (code == GIT_ECERTIFICATE || klass == GIT_ERROR_NET || klass == GIT_ERROR_SSL ||
        klass == GIT_ERROR_SSH || klass == GIT_ERROR_HTTP) {
        return GitErrorKind::Network;
    }
    return GitErrorKind::Other;
}

[[noreturn]] void fail(int code, const std::string& what) {
    auto kind = classify_error(code);
    std::string message = fmt::format("{} failed with: {}", what, last_error());
    tandem_log(fmt::format("git: {} ({})", message, git_error_kind_name(kind)));
    throw GitError(kind, message);
}

void check(int code, const std::string& what) {
    if (code < 0) fail(code, what);
}

std::string oid_hex(const git_oid* oid) {
    return git_oid_tostr_s(oid);
}

git_oid parse_oid(const std::string& hex) {
    git_oid oid;
    if (git_oid_fromstr(&oid, hex.c_str()) != 0) {
        throw GitError(GitErrorKind::NotFound, "invalid object id " + hex);
    }
    return oid;
}

// Owns the strings behind a git_strarray
class StrArray {
public:
    explicit StrArray(std::vector<std::string> entries) : storage_(std::move(entries)) {
        for (auto& s : storage_) ptrs_.push_back(s.data());
    }
    git_strarray get() {
        return git_strarray{ptrs_.data(), ptrs_.size()};
    }
private:
    std::vector<std::string> storage_;
    std::vector<char*> ptrs_;
};

// ── Remote callbacks ────────────────────────────────────────

struct RemotePayload {
    const GitCredentials* creds = nullptr;
    const TransferProgressCallback* progress = nullptr;
    int credential_attempts = 0;
    std::vector<std::string> rejections;
};

int credentials_cb(git_credential** out, const char* /*url*/, const char* username_from_url,
                   unsigned int allowed_types, void* payload) {
    auto* p = static_cast<RemotePayload*>(payload);
    // A second request means the first answer was refused
    if (++p->credential_attempts > 1) {
        git_error_set_str(GIT_ERROR_NET, "authentication rejected by remote");
        return GIT_EAUTH;
    }

    const GitCredentials& creds = *p->creds;
    std::string url_user = username_from_url ? username_from_url : "";

    if ((allowed_types & GIT_CREDENTIAL_USERPASS_PLAINTEXT) && !creds.empty()) {
        std::string user = !creds.username.empty() ? creds.username
                         : !url_user.empty() ? url_user : "oauth2";
        return git_credential_userpass_plaintext_new(out, user.c_str(), creds.password.c_str());
    }
    if (allowed_types & GIT_CREDENTIAL_SSH_KEY) {
        return git_credential_ssh_key_from_agent(out, url_user.empty() ? "git" : url_user.c_str());
    }
    if (allowed_types & GIT_CREDENTIAL_USERNAME) {
        std::string user = !creds.username.empty() ? creds.username : url_user;
        return git_credential_username_new(out, user.c_str());
    }
    return GIT_PASSTHROUGH;
}

int fetch_progress_cb(const git_indexer_progress* stats, void* payload) {
    auto* p = static_cast<RemotePayload*>(payload);
    if (p->progress && *p->progress) {
        TransferProgress tp;
        tp.current = stats->received_objects;
        tp.total = stats->total_objects;
        tp.bytes = stats->received_bytes;
        tp.stage = stats->received_objects < stats->total_objects ? "receiving" : "indexing";
        (*p->progress)(tp);
    }
    return 0;
}

int push_progress_cb(unsigned int current, unsigned int total, size_t bytes, void* payload) {
    auto* p = static_cast<RemotePayload*>(payload);
    if (p->progress && *p->progress) {
        TransferProgress tp;
        tp.current = current;
        tp.total = total;
        tp.bytes = bytes;
        tp.stage = "pushing";
        (*p->progress)(tp);
    }
    return 0;
}

int push_update_cb(const char* refname, const char* status, void* payload) {
    if (status) {
        auto* p = static_cast<RemotePayload*>(payload);
        p->rejections.push_back(fmt::format("{}: {}", refname, status));
    }
    return 0;
}

void install_callbacks(git_remote_callbacks& cb, RemotePayload& payload) {
    cb.credentials = credentials_cb;
    cb.transfer_progress = fetch_progress_cb;
    cb.push_transfer_progress = push_progress_cb;
    cb.push_update_reference = push_update_cb;
    cb.payload = &payload;
}

int collect_blobs_cb(const char* root, const git_tree_entry* entry, void* payload) {
    if (git_tree_entry_type(entry) == GIT_OBJECT_BLOB) {
        auto* listing = static_cast<TreeListing*>(payload);
        (*listing)[std::string(root) + git_tree_entry_name(entry)] =
            oid_hex(git_tree_entry_id(entry));
    }
    return 0;
}

} // namespace

// ── Construction ────────────────────────────────────────────

Libgit2Backend::Libgit2Backend(fs::path workdir) : workdir_(std::move(workdir)) {
    ensure_library();
    if (git_repository_open(&repo_, workdir_.c_str()) != 0) {
        repo_ = nullptr;
    }
}

Libgit2Backend::~Libgit2Backend() {
    if (repo_) git_repository_free(repo_);
}

git_repository* Libgit2Backend::repo() const {
    if (!repo_) {
        throw GitError(GitErrorKind::NotFound, "no git repository at " + workdir_.string());
    }
    return repo_;
}

void Libgit2Backend::init(const std::string& default_branch) {
    if (repo_) return;

    git_repository_init_options opts;
    git_repository_init_options_init(&opts, GIT_REPOSITORY_INIT_OPTIONS_VERSION);
    opts.flags = GIT_REPOSITORY_INIT_MKPATH;
    opts.initial_head = default_branch.c_str();
    check(git_repository_init_ext(&repo_, workdir_.c_str(), &opts),
          "initializing repository " + workdir_.string());
}

// ── Remotes ─────────────────────────────────────────────────

void Libgit2Backend::add_remote(const std::string& name, const std::string& url) {
    git_remote* raw = nullptr;
    int rc = git_remote_create(&raw, repo(), name.c_str(), url.c_str());
    RemotePtr remote(raw);
    if (rc == GIT_EEXISTS) {
        check(git_remote_set_url(repo(), name.c_str(), url.c_str()), "updating remote " + name);
        return;
    }
    check(rc, "creating remote " + name);
}

std::optional<std::string> Libgit2Backend::remote_url(const std::string& name) {
    git_remote* raw = nullptr;
    int rc = git_remote_lookup(&raw, repo(), name.c_str());
    RemotePtr remote(raw);
    if (rc == GIT_ENOTFOUND || rc == GIT_EINVALIDSPEC) return std::nullopt;
    check(rc, "looking up remote " + name);
    const char* url = git_remote_url(remote.get());
    if (!url) return std::nullopt;
    return std::string(url);
}

// ── Index / status ──────────────────────────────────────────

void Libgit2Backend::add(const std::vector<std::string>& paths) {
    git_index* raw = nullptr;
    check(git_repository_index(&raw, repo()), "opening index");
    IndexPtr index(raw);

    StrArray specs(paths);
    git_strarray arr = specs.get();
    check(git_index_add_all(index.get(), &arr, GIT_INDEX_ADD_DEFAULT, nullptr, nullptr),
          "staging files");
    // Picks up deletions, which add_all skips
    check(git_index_update_all(index.get(), &arr, nullptr, nullptr), "staging deletions");
    check(git_index_write(index.get()), "writing index");
}

void Libgit2Backend::remove(const std::string& path) {
    git_index* raw = nullptr;
    check(git_repository_index(&raw, repo()), "opening index");
    IndexPtr index(raw);

    check(git_index_remove_bypath(index.get(), path.c_str()), "unstaging " + path);
    check(git_index_write(index.get()), "writing index");
}

std::vector<StatusEntry> Libgit2Backend::status() {
    git_status_options opts;
    git_status_options_init(&opts, GIT_STATUS_OPTIONS_VERSION);
    opts.show = GIT_STATUS_SHOW_INDEX_AND_WORKDIR;
    opts.flags = GIT_STATUS_OPT_INCLUDE_UNTRACKED | GIT_STATUS_OPT_RECURSE_UNTRACKED_DIRS;

    git_status_list* raw = nullptr;
    check(git_status_list_new(&raw, repo(), &opts), "reading status");
    StatusPtr list(raw);

    std::vector<StatusEntry> out;
    size_t n = git_status_list_entrycount(list.get());
    for (size_t i = 0; i < n; ++i) {
        const git_status_entry* e = git_status_byindex(list.get(), i);
        if (!e || e->status == GIT_STATUS_CURRENT || (e->status & GIT_STATUS_IGNORED)) continue;

        const git_diff_delta* delta = e->index_to_workdir ? e->index_to_workdir : e->head_to_index;
        if (!delta) continue;
        const char* path = delta->new_file.path ? delta->new_file.path : delta->old_file.path;

        FileChange change = FileChange::Modified;
        if (e->status & (GIT_STATUS_WT_DELETED | GIT_STATUS_INDEX_DELETED)) {
            change = FileChange::Deleted;
        } else if (e->status & GIT_STATUS_WT_NEW) {
            change = FileChange::Untracked;
        } else if (e->status & GIT_STATUS_INDEX_NEW) {
            change = FileChange::Added;
        }
        out.push_back({path, change});
    }
    return out;
}

// ── Commits ─────────────────────────────────────────────────

std::string Libgit2Backend::commit(const std::string& message, const AuthorIdentity& author,
                                   const std::vector<std::string>& parents) {
    git_index* raw_index = nullptr;
    check(git_repository_index(&raw_index, repo()), "opening index");
    IndexPtr index(raw_index);

    git_oid tree_oid;
    check(git_index_write_tree(&tree_oid, index.get()), "writing tree");
    git_tree* raw_tree = nullptr;
    check(git_tree_lookup(&raw_tree, repo(), &tree_oid), "looking up tree");
    TreePtr tree(raw_tree);

    git_signature* raw_sig = nullptr;
    if (!author.name.empty() && !author.email.empty()) {
        check(git_signature_now(&raw_sig, author.name.c_str(), author.email.c_str()),
              "creating signature");
    } else if (git_signature_default(&raw_sig, repo()) != 0) {
        check(git_signature_now(&raw_sig, DEFAULT_AUTHOR_NAME, DEFAULT_AUTHOR_EMAIL), "creating signature");
    }
    SigPtr sig(raw_sig);

    std::vector<std::string> parent_ids = parents;
    if (parent_ids.empty()) {
        git_oid head;
        if (git_reference_name_to_id(&head, repo(), "HEAD") == 0) {
            parent_ids.push_back(oid_hex(&head));
        }
    }

    std::vector<CommitPtr> owned;
    std::vector<const git_commit*> parent_ptrs;
    for (const auto& id : parent_ids) {
        git_oid oid = parse_oid(id);
        git_commit* c = nullptr;
        check(git_commit_lookup(&c, repo(), &oid), "looking up parent " + id);
        owned.emplace_back(c);
        parent_ptrs.push_back(c);
    }

    git_oid commit_oid;
    check(git_commit_create(&commit_oid, repo(), "HEAD", sig.get(), sig.get(), nullptr,
                            message.c_str(), tree.get(), parent_ptrs.size(),
                            parent_ptrs.data()),
          "creating commit");

    std::string hex = oid_hex(&commit_oid);
    tandem_log(fmt::format("git: commit {} ({} parents) \"{}\"", hex.substr(0, 8),
                           parent_ptrs.size(), message));
    return hex;
}

// ── Network ─────────────────────────────────────────────────

void Libgit2Backend::fetch(const std::string& remote_name, const GitCredentials& creds,
                           const TransferProgressCallback& progress) {
    git_remote* raw = nullptr;
    check(git_remote_lookup(&raw, repo(), remote_name.c_str()), "looking up remote " + remote_name);
    RemotePtr remote(raw);

    RemotePayload payload;
    payload.creds = &creds;
    payload.progress = &progress;

    git_fetch_options opts;
    git_fetch_options_init(&opts, GIT_FETCH_OPTIONS_VERSION);
    install_callbacks(opts.callbacks, payload);

    int rc = git_remote_fetch(remote.get(), nullptr, &opts, "tandem: fetch");
    if (rc < 0 && payload.credential_attempts > 1) {
        throw GitError(GitErrorKind::Auth, "fetch from " + remote_name + ": " + last_error());
    }
    check(rc, "fetch from " + remote_name);
}

void Libgit2Backend::push(const std::string& remote_name, const std::string& branch,
                          const GitCredentials& creds,
                          const TransferProgressCallback& progress) {
    git_remote* raw = nullptr;
    check(git_remote_lookup(&raw, repo(), remote_name.c_str()), "looking up remote " + remote_name);
    RemotePtr remote(raw);

    RemotePayload payload;
    payload.creds = &creds;
    payload.progress = &progress;

    git_push_options opts;
    git_push_options_init(&opts, GIT_PUSH_OPTIONS_VERSION);
    install_callbacks(opts.callbacks, payload);

    StrArray specs({fmt::format("refs/heads/{0}:refs/heads/{0}", branch)});
    git_strarray arr = specs.get();

    int rc = git_remote_push(remote.get(), &arr, &opts);
    if (rc < 0 && payload.credential_attempts > 1) {
        throw GitError(GitErrorKind::Auth, "push to " + remote_name + ": " + last_error());
    }
    check(rc, "push to " + remote_name);

    if (!payload.rejections.empty()) {
        std::string joined;
        for (const auto& r : payload.rejections) {
            if (!joined.empty()) joined += "; ";
            joined += r;
        }
        throw GitError(GitErrorKind::Rejected, "push rejected: " + joined);
    }
}

// ── Refs / checkout ─────────────────────────────────────────

void Libgit2Backend::checkout(const std::string& ref) {
    std::string branch_ref = starts_with(ref, "refs/heads/") ? ref : "refs/heads/" + ref;
    git_reference* raw_ref = nullptr;
    bool is_branch = git_reference_lookup(&raw_ref, repo(), branch_ref.c_str()) == 0;
    RefPtr branch(raw_ref);

    auto target = resolve_ref(is_branch ? branch_ref : ref);
    if (!target) throw GitError(GitErrorKind::NotFound, "cannot check out unknown ref " + ref);

    git_oid oid = parse_oid(*target);
    git_object* raw_obj = nullptr;
    check(git_object_lookup(&raw_obj, repo(), &oid, GIT_OBJECT_COMMIT), "looking up " + ref);
    ObjectPtr obj(raw_obj);

    git_checkout_options opts;
    git_checkout_options_init(&opts, GIT_CHECKOUT_OPTIONS_VERSION);
    opts.checkout_strategy = GIT_CHECKOUT_FORCE;
    check(git_checkout_tree(repo(), obj.get(), &opts), "checking out " + ref);

    if (is_branch) {
        check(git_repository_set_head(repo(), branch_ref.c_str()), "moving HEAD to " + ref);
    } else {
        check(git_repository_set_head_detached(repo(), &oid), "detaching HEAD at " + ref);
    }
}

std::string Libgit2Backend::current_branch() {
    git_reference* raw = nullptr;
    int rc = git_repository_head(&raw, repo());
    RefPtr head(raw);

    if (rc == GIT_EUNBORNBRANCH || rc == GIT_ENOTFOUND) {
        // Unborn branch: HEAD still names it symbolically
        git_reference* raw_sym = nullptr;
        check(git_reference_lookup(&raw_sym, repo(), "HEAD"), "reading HEAD");
        RefPtr sym(raw_sym);
        const char* target = git_reference_symbolic_target(sym.get());
        if (!target) throw GitError(GitErrorKind::NotFound, "HEAD does not name a branch");
        std::string name = target;
        if (starts_with(name, "refs/heads/")) name = name.substr(11);
        return name;
    }
    check(rc, "reading HEAD");

    if (!git_reference_is_branch(head.get())) {
        throw GitError(GitErrorKind::NotFound, "HEAD is detached");
    }
    return git_reference_shorthand(head.get());
}

std::optional<std::string> Libgit2Backend::resolve_ref(const std::string& ref) {
    std::string spec = ref + "^{commit}";
    git_object* raw = nullptr;
    int rc = git_revparse_single(&raw, repo(), spec.c_str());
    ObjectPtr obj(raw);
    if (rc == GIT_ENOTFOUND || rc == GIT_EUNBORNBRANCH || rc == GIT_EINVALIDSPEC ||
        rc == GIT_EAMBIGUOUS) {
        return std::nullopt;
    }
    check(rc, "resolving " + ref);
    return oid_hex(git_object_id(obj.get()));
}

void Libgit2Backend::write_ref(const std::string& ref, const std::string& oid_str) {
    git_oid oid = parse_oid(oid_str);
    git_reference* raw = nullptr;
    check(git_reference_create(&raw, repo(), ref.c_str(), &oid, 1, "tandem: update ref"),
          "writing " + ref);
    RefPtr created(raw);
}

std::vector<std::string> Libgit2Backend::list_branches(bool remote) {
    git_branch_iterator* raw_it = nullptr;
    check(git_branch_iterator_new(&raw_it, repo(), remote ? GIT_BRANCH_REMOTE : GIT_BRANCH_LOCAL),
          "listing branches");
    BranchIter it(raw_it);

    std::vector<std::string> out;
    git_reference* raw_ref = nullptr;
    git_branch_t type;
    int rc;
    while ((rc = git_branch_next(&raw_ref, &type, it.get())) == 0) {
        RefPtr ref(raw_ref);
        const char* name = nullptr;
        if (git_branch_name(&name, ref.get()) == 0 && name) {
            std::string n = name;
            if (!(remote && n.size() >= 5 && n.compare(n.size() - 5, 5, "/HEAD") == 0)) {
                out.push_back(n);
            }
        }
    }
    if (rc != GIT_ITEROVER) check(rc, "listing branches");
    return out;
}

// ── Objects ─────────────────────────────────────────────────

std::optional<std::string> Libgit2Backend::read_blob(const std::string& commit_id,
                                                     const std::string& path) {
    git_oid oid = parse_oid(commit_id);
    git_commit* raw_commit = nullptr;
    int rc = git_commit_lookup(&raw_commit, repo(), &oid);
    CommitPtr commit(raw_commit);
    if (rc == GIT_ENOTFOUND) return std::nullopt;
    check(rc, "looking up commit " + commit_id);

    git_tree* raw_tree = nullptr;
    check(git_commit_tree(&raw_tree, commit.get()), "reading tree of " + commit_id);
    TreePtr tree(raw_tree);

    git_tree_entry* raw_entry = nullptr;
    rc = git_tree_entry_bypath(&raw_entry, tree.get(), path.c_str());
    EntryPtr entry(raw_entry);
    if (rc == GIT_ENOTFOUND) return std::nullopt;
    check(rc, "looking up " + path);
    if (git_tree_entry_type(entry.get()) != GIT_OBJECT_BLOB) return std::nullopt;

    git_blob* raw_blob = nullptr;
    check(git_blob_lookup(&raw_blob, repo(), git_tree_entry_id(entry.get())), "reading " + path);
    BlobPtr blob(raw_blob);

    return std::string(static_cast<const char*>(git_blob_rawcontent(blob.get())),
                       static_cast<size_t>(git_blob_rawsize(blob.get())));
}

std::vector<CommitInfo> Libgit2Backend::log(const std::string& ref, size_t depth) {
    std::vector<CommitInfo> out;
    auto start = resolve_ref(ref);
    if (!start) return out;

    git_revwalk* raw_walk = nullptr;
    check(git_revwalk_new(&raw_walk, repo()), "creating revwalk");
    WalkPtr walk(raw_walk);
    git_revwalk_sorting(walk.get(), GIT_SORT_TIME | GIT_SORT_TOPOLOGICAL);

    git_oid oid = parse_oid(*start);
    check(git_revwalk_push(walk.get(), &oid), "walking " + ref);

    while (depth == 0 || out.size() < depth) {
        int rc = git_revwalk_next(&oid, walk.get());
        if (rc == GIT_ITEROVER) break;
        check(rc, "walking " + ref);

        git_commit* raw_commit = nullptr;
        check(git_commit_lookup(&raw_commit, repo(), &oid), "reading commit");
        CommitPtr c(raw_commit);

        CommitInfo info;
        info.oid = oid_hex(&oid);
        const char* msg = git_commit_message(c.get());
        info.message = msg ? msg : "";
        if (const git_signature* a = git_commit_author(c.get())) {
            info.author_name = a->name ? a->name : "";
            info.author_email = a->email ? a->email : "";
        }
        info.time = static_cast<int64_t>(git_commit_time(c.get()));
        unsigned int n = git_commit_parentcount(c.get());
        for (unsigned int i = 0; i < n; ++i) {
            info.parents.push_back(oid_hex(git_commit_parent_id(c.get(), i)));
        }
        out.push_back(std::move(info));
    }
    return out;
}

std::optional<std::string> Libgit2Backend::merge_base(const std::string& a, const std::string& b) {
    git_oid oa = parse_oid(a);
    git_oid ob = parse_oid(b);
    git_oid base;
    int rc = git_merge_base(&base, repo(), &oa, &ob);
    if (rc == GIT_ENOTFOUND) return std::nullopt;
    check(rc, "finding merge base");
    return oid_hex(&base);
}

TreeListing Libgit2Backend::list_files(const std::string& commit_id) {
    TreeListing listing;

    git_oid oid = parse_oid(commit_id);
    git_commit* raw_commit = nullptr;
    check(git_commit_lookup(&raw_commit, repo(), &oid), "looking up commit " + commit_id);
    CommitPtr commit(raw_commit);

    git_tree* raw_tree = nullptr;
    check(git_commit_tree(&raw_tree, commit.get()), "reading tree of " + commit_id);
    TreePtr tree(raw_tree);

    check(git_tree_walk(tree.get(), GIT_TREEWALK_PRE, collect_blobs_cb, &listing),
          "walking tree of " + commit_id);
    return listing;
}

// ── Maintenance ─────────────────────────────────────────────

PackStats Libgit2Backend::pack_objects() {
    PackStats stats;

    git_revwalk* raw_walk = nullptr;
    check(git_revwalk_new(&raw_walk, repo()), "creating revwalk");
    WalkPtr walk(raw_walk);

    bool any = false;
    for (const char* glob : {"refs/heads/*", "refs/remotes/*", "refs/tags/*"}) {
        if (git_revwalk_push_glob(walk.get(), glob) == 0) any = true;
    }
    if (git_revwalk_push_head(walk.get()) == 0) any = true;
    if (!any) return stats;

    git_packbuilder* raw_pb = nullptr;
    check(git_packbuilder_new(&raw_pb, repo()), "creating packbuilder");
    PackPtr pb(raw_pb);

    check(git_packbuilder_insert_walk(pb.get(), walk.get()), "collecting objects");
    stats.objects_packed = git_packbuilder_object_count(pb.get());
    if (stats.objects_packed == 0) return stats;

    fs::path objects_dir = fs::path(git_repository_path(repo())) / "objects";
    fs::path pack_dir = objects_dir / "pack";
    check(git_packbuilder_write(pb.get(), pack_dir.c_str(), 0, nullptr, nullptr), "writing pack");

    // Only drop loose objects the pack directory now provides
    git_odb* raw_odb = nullptr;
    check(git_odb_new(&raw_odb), "opening pack database");
    OdbPtr odb(raw_odb);
    git_odb_backend* backend = nullptr;
    check(git_odb_backend_pack(&backend, objects_dir.c_str()), "opening packs");
    check(git_odb_add_backend(odb.get(), backend, 1), "opening packs");

    std::error_code ec;
    for (const auto& dir : fs::directory_iterator(objects_dir, ec)) {
        std::string prefix = dir.path().filename().string();
        if (!dir.is_directory() || prefix.size() != 2 ||
            !std::isxdigit(static_cast<unsigned char>(prefix[0])) ||
            !std::isxdigit(static_cast<unsigned char>(prefix[1]))) {
            continue;
        }
        for (const auto& file : fs::directory_iterator(dir.path(), ec)) {
            std::string hex = prefix + file.path().filename().string();
            git_oid oid;
            if (git_oid_fromstr(&oid, hex.c_str()) != 0) continue;
            if (!git_odb_exists(odb.get(), &oid)) continue;
            std::error_code rm_ec;
            if (fs::remove(file.path(), rm_ec)) ++stats.loose_removed;
        }
        std::error_code rm_ec;
        if (fs::is_empty(dir.path(), rm_ec)) fs::remove(dir.path(), rm_ec);
    }

    tandem_log(fmt::format("git: packed {} objects, removed {} loose",
                           stats.objects_packed, stats.loose_removed));
    return stats;
}
