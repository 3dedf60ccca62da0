#include "archive.hpp"

namespace conv {

    std::shared_ptr<NullArchiveEntry> NullArchiveEntry::getNull() {
        static std::shared_ptr<NullArchiveEntry> nullArchiveEntry =
            std::make_shared<NullArchiveEntry>();
        return nullArchiveEntry;
    }

} // namespace conv
