#include "model/events.hpp"

namespace begone::model
{

    std::string actionKey(MatchAction action)
    {
        switch (action)
        {
        case MatchAction::Visited:
            return "visited";
        case MatchAction::WouldDelete:
            return "would_delete";
        case MatchAction::Deleted:
            return "deleted";
        case MatchAction::Failed:
            return "failed";
        }
        return "failed";
    }

} // namespace begone::model
