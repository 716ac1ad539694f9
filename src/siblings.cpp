#include <algorithm>
#include "sample_sweep/siblings.hpp"

namespace sample_sweep {

    namespace {
        bool has_extension(const CandidateItem& item, const std::vector<std::string>& extensions) {
            if (item.kind != ItemKind::File || item.extension.empty()) {
                return false;
            }
            return std::find(extensions.begin(), extensions.end(), item.extension) != extensions.end();
        }
    }

    void VideoSiblingGroups::add(const CandidateItem& item) {
        VideoSiblingGroup& group = groups_[item.parent];
        group.max_size_bytes = std::max(group.max_size_bytes, item.size_bytes);
        ++group.member_count;
    }

    std::optional<std::uintmax_t> VideoSiblingGroups::comparable_max(const CandidateItem& item) const {
        const VideoSiblingGroup* group = find(item.parent);
        if (!group || group->member_count < 2) {
            return std::nullopt;
        }
        return group->max_size_bytes;
    }

    const VideoSiblingGroup* VideoSiblingGroups::find(const std::string& parent) const {
        auto it = groups_.find(parent);
        return it == groups_.end() ? nullptr : &it->second;
    }

    bool is_video_file(const CandidateItem& item, const Configuration& config) {
        return has_extension(item, config.video_extensions);
    }

    bool is_audio_file(const CandidateItem& item, const Configuration& config) {
        return has_extension(item, config.audio_extensions);
    }

    VideoSiblingGroups group_video_siblings(const std::vector<CandidateItem>& items, const Configuration& config) {
        VideoSiblingGroups groups;
        for (const auto& item : items) {
            if (is_video_file(item, config)) {
                groups.add(item);
            }
        }
        return groups;
    }
}
