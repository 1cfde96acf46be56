#ifndef ROLLCALL_IDENTITY_STORE_H
#define ROLLCALL_IDENTITY_STORE_H

#include "database.h"
#include "../encoding.h"
#include "../identity.h"
#include <optional>
#include <string>
#include <vector>

namespace rollcall {

struct EnrolledIdentity {
    std::string roll_no;
    std::string name;
    std::string class_name;
    std::string section;
    std::optional<std::string> subject;
    FaceEncoding embedding;     // canonical, unit length
    size_t sample_count = 0;
    std::string enrolled_at;    // "YYYY-MM-DD HH:MM:SS", filled in by upsert when empty
};

// Narrowing levels: none, class, class+section, class+section+subject
struct IdentityFilter {
    std::optional<std::string> class_name;
    std::optional<std::string> section;
    std::optional<std::string> subject;

    static IdentityFilter all() { return {}; }
    static IdentityFilter forScope(const Scope& scope) {
        return {scope.class_name, scope.section, scope.subject};
    }

    std::string toString() const;
};

enum class DeleteStatus {
    Deleted,
    NotFound
};

struct DeleteResult {
    DeleteStatus status = DeleteStatus::NotFound;
    size_t identities_removed = 0;
    size_t records_removed = 0;     // attendance rows removed with them
};

/**
 * Durable relation of enrolled identities keyed by roll number.
 *
 * The embedding dimension is pinned by the first upsert and enforced on every
 * later one. All reads return copies.
 */
class IdentityStore {
public:
    explicit IdentityStore(Database& db) : db_(db) {}

    /**
     * Insert or fully replace the identity with this roll number.
     * Attendance history of a replaced identity is kept.
     *
     * @throws ValidationError for a bad roll code, empty name/scope or empty embedding
     * @throws DimensionMismatchError when the embedding length differs from the pinned dimension
     * @throws StoreError on database failure
     */
    void upsert(const EnrolledIdentity& identity);

    std::optional<EnrolledIdentity> get(const std::string& roll_no);

    // Sorted by roll number. Subject without section throws ValidationError.
    std::vector<EnrolledIdentity> list(const IdentityFilter& filter = IdentityFilter::all());

    // Candidates for matching: one consistent read of everything in scope.
    // A scope without subject covers every subject of the class/section.
    std::vector<EnrolledIdentity> snapshot(const Scope& scope);

    size_t count();

    // Pinned embedding dimension, empty until the first enrollment
    std::optional<size_t> dimension();

    DeleteResult deleteIdentity(const std::string& roll_no);

    /**
     * Remove every identity in scope together with all of their attendance
     * and any attendance rows recorded under the scope.
     *
     * @throws ValidationError when subject is given without section or class is empty
     */
    DeleteResult deleteScope(const std::string& class_name,
                             const std::optional<std::string>& section,
                             const std::optional<std::string>& subject);

    // Remove all identities and attendance, and unpin the dimension
    DeleteResult clear();

private:
    std::optional<size_t> dimensionLocked();
    std::vector<EnrolledIdentity> query(const IdentityFilter& filter);

    Database& db_;
};

// Raw little-endian float32 blob, as stored in the embedding column
std::vector<uint8_t> packEncoding(const FaceEncoding& encoding);
FaceEncoding unpackEncoding(const std::vector<uint8_t>& blob);

} // namespace rollcall

#endif // ROLLCALL_IDENTITY_STORE_H
