#pragma once
#include <map>
#include <string>
#include <vector>
#include <optional>
#include "sample_sweep/types.hpp"

namespace sample_sweep {
    class VideoSiblingGroups {
    public:
        void add(const CandidateItem& item);

        // Largest video size in the item's folder, or nothing when the item is
        // the only video there.
        std::optional<std::uintmax_t> comparable_max(const CandidateItem& item) const;

        const VideoSiblingGroup* find(const std::string& parent) const;
        std::size_t size() const { return groups_.size(); }

    private:
        std::map<std::string, VideoSiblingGroup> groups_;
    };

    bool is_video_file(const CandidateItem& item, const Configuration& config);
    bool is_audio_file(const CandidateItem& item, const Configuration& config);

    VideoSiblingGroups group_video_siblings(const std::vector<CandidateItem>& items, const Configuration& config);
}
