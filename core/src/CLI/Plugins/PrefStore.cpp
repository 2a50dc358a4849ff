#include "PrefStore.hpp"

#include <glaze/json.hpp> // glz::read_file_json, glz::write_file_json
#include <cstdint>        // std::uintmax_t
#include <matchit.hpp>    // matchit::impl::Overload
#include <system_error>   // std::error_code

#include <Switchboard/Utils/Logging.hpp>

namespace fs = std::filesystem;

namespace switchboard::plugins {
  using namespace utils::types;
  using enum utils::error::SwbErrorCode;

  using Task   = core::runtime::Task<PrefMessage>;
  using Update = core::plugin::UpdateResult<PrefMessage, PrefOutput>;

  namespace {
    auto Identity(PrefMessage message) -> PrefMessage {
      return message;
    }

    auto ToOutput(auto output) -> Update {
      return Update::withOutput(PrefOutput { std::move(output) });
    }

    auto EntryKey(const StringView group, const StringView key) -> String {
      return std::format("{}/{}", group, key);
    }

    // Caller holds files.mutex.
    auto ClaimWrite(PrefFiles& files, const StringView group, const StringView key, const u64 sequence) -> bool {
      u64& newest = files.newest[EntryKey(group, key)];

      if (sequence < newest)
        return false;

      newest = sequence;
      return true;
    }
  } // namespace

  auto PrefStoreState::groupPath(const StringView group) const -> fs::path {
    return directory / std::format("{}.json", group);
  }

  auto LoadGroup(const fs::path& path) -> Result<PrefGroup> {
    std::error_code errc;

    const bool exists = fs::exists(path, errc);

    if (errc)
      ERR_FMT(IoError, "Failed to stat '{}': {}", path.string(), errc.message());

    if (!exists)
      return PrefGroup {};

    const std::uintmax_t size = fs::file_size(path, errc);

    if (errc)
      ERR_FMT(IoError, "Failed to stat '{}': {}", path.string(), errc.message());

    if (size == 0)
      return PrefGroup {};

    PrefGroup group;
    String    buffer;

    if (const auto readError = glz::read_file_json(group, path.string(), buffer))
      ERR_FMT(ParseError, "Failed to parse group file '{}': {}", path.string(), glz::format_error(readError, buffer));

    return group;
  }

  auto SaveGroup(const fs::path& path, const PrefGroup& group) -> Result<> {
    std::error_code errc;
    fs::create_directories(path.parent_path(), errc);

    if (errc)
      ERR_FMT(IoError, "Failed to create storage directory '{}': {}", path.parent_path().string(), errc.message());

    String buffer;

    if (const auto writeError = glz::write_file_json<glz::opts { .prettify = true }>(group, path.string(), buffer))
      ERR_FMT(IoError, "Failed to write group file '{}': {}", path.string(), glz::format_error(writeError, buffer));

    return {};
  }

  auto PrefStorePlugin::init() const -> Pair<State, Task> {
    debug_log("Preference store at {}", m_directory.string());

    return {
      State { .cache = {}, .directory = m_directory, .files = std::make_shared<PrefFiles>(), .writeSequence = 0, .tombstones = {} },
      Task::none(),
    };
  }

  auto PrefStorePlugin::update(State& state, Message message) const -> Update {
    using matchit::impl::Overload;

    return std::visit(
      Overload {
        [&](pref::Set& set) -> Update {
          state.cache[set.group][set.key] = set.value;
          state.tombstones.erase(EntryKey(set.group, set.key));

          Task save = Task::perform(
            [path = state.groupPath(set.group), files = state.files, sequence = ++state.writeSequence, set]() -> PrefMessage {
              const LockGuard guard(files->mutex);

              if (!ClaimWrite(*files, set.group, set.key, sequence))
                return PrefMessage { pref::Saved { .group = set.group, .error = None } };

              Result<PrefGroup> group = LoadGroup(path);
              if (!group)
                return PrefMessage { pref::Saved { .group = set.group, .error = group.error().message } };

              (*group)[set.key] = set.value;

              Result<> saved = SaveGroup(path, *group);
              return PrefMessage { pref::Saved { .group = set.group, .error = saved ? None : Option<String>(saved.error().message) } };
            },
            Identity
          );

          return { .task = std::move(save), .output = PrefOutput { PrefSet { .group = set.group, .key = set.key } } };
        },
        [&](pref::Get& get) -> Update {
          if (auto group = state.cache.find(get.group); group != state.cache.end())
            if (auto value = group->second.find(get.key); value != group->second.end())
              return ToOutput(PrefValue { .group = get.group, .key = get.key, .value = value->second });

          // Deleted in memory; the file may still hold the old value.
          if (state.tombstones.contains(EntryKey(get.group, get.key)))
            return ToOutput(PrefNotFound { .group = get.group, .key = get.key });

          return Update::withTask(Task::perform(
            [path = state.groupPath(get.group), files = state.files, get]() -> PrefMessage {
              const LockGuard guard(files->mutex);

              Result<PrefGroup> group = LoadGroup(path);
              if (!group)
                return PrefMessage { pref::Loaded { .group = get.group, .key = get.key, .value = None, .error = group.error().message } };

              auto value = group->find(get.key);
              return PrefMessage { pref::Loaded {
                .group = get.group,
                .key   = get.key,
                .value = value != group->end() ? Option<String>(value->second) : None,
                .error = None,
              } };
            },
            Identity
          ));
        },
        [&](pref::Delete& del) -> Update {
          if (auto group = state.cache.find(del.group); group != state.cache.end())
            group->second.erase(del.key);

          const u64 sequence = ++state.writeSequence;

          state.tombstones[EntryKey(del.group, del.key)] = sequence;

          return Update::withTask(Task::perform(
            [path = state.groupPath(del.group), files = state.files, sequence, del]() -> PrefMessage {
              const LockGuard guard(files->mutex);

              // A newer Set already rewrote the key.
              if (!ClaimWrite(*files, del.group, del.key, sequence))
                return PrefMessage { pref::Removed { .group = del.group, .key = del.key, .sequence = sequence, .existed = true, .error = None } };

              Result<PrefGroup> group = LoadGroup(path);
              if (!group)
                return PrefMessage { pref::Removed { .group = del.group, .key = del.key, .sequence = sequence, .existed = false, .error = group.error().message } };

              if (group->erase(del.key) == 0)
                return PrefMessage { pref::Removed { .group = del.group, .key = del.key, .sequence = sequence, .existed = false, .error = None } };

              Result<> saved = SaveGroup(path, *group);
              return PrefMessage { pref::Removed {
                .group    = del.group,
                .key      = del.key,
                .sequence = sequence,
                .existed  = true,
                .error    = saved ? None : Option<String>(saved.error().message),
              } };
            },
            Identity
          ));
        },
        [&](pref::Loaded& loaded) -> Update {
          if (loaded.error) {
            warn_log("Failed to load '{}/{}': {}", loaded.group, loaded.key, *loaded.error);
            return ToOutput(PrefError { .message = std::move(*loaded.error) });
          }

          // A Delete issued after this read went out.
          if (state.tombstones.contains(EntryKey(loaded.group, loaded.key)))
            return ToOutput(PrefNotFound { .group = std::move(loaded.group), .key = std::move(loaded.key) });

          // A Set issued after this read went out.
          if (auto group = state.cache.find(loaded.group); group != state.cache.end())
            if (auto value = group->second.find(loaded.key); value != group->second.end())
              return ToOutput(PrefValue { .group = std::move(loaded.group), .key = std::move(loaded.key), .value = value->second });

          if (!loaded.value)
            return ToOutput(PrefNotFound { .group = std::move(loaded.group), .key = std::move(loaded.key) });

          state.cache[loaded.group][loaded.key] = *loaded.value;
          return ToOutput(PrefValue { .group = std::move(loaded.group), .key = std::move(loaded.key), .value = std::move(*loaded.value) });
        },
        [&](pref::Saved& saved) -> Update {
          if (!saved.error)
            return Update::none();

          warn_log("Failed to save group '{}': {}", saved.group, *saved.error);
          return ToOutput(PrefError { .message = std::format("Failed to save group '{}': {}", saved.group, *saved.error) });
        },
        [&](pref::Removed& removed) -> Update {
          if (auto tombstone = state.tombstones.find(EntryKey(removed.group, removed.key));
              tombstone != state.tombstones.end() && tombstone->second == removed.sequence)
            state.tombstones.erase(tombstone);

          if (removed.error)
            return ToOutput(PrefError { .message = std::format("Failed to delete '{}/{}': {}", removed.group, removed.key, *removed.error) });

          if (!removed.existed)
            return ToOutput(PrefNotFound { .group = std::move(removed.group), .key = std::move(removed.key) });

          return ToOutput(PrefDeleted { .group = std::move(removed.group), .key = std::move(removed.key) });
        },
      },
      message.kind
    );
  }

  auto PrefStorePlugin::subscription(const State& /*state*/) const -> core::runtime::Subscription<Message> {
    return core::runtime::Subscription<Message>::none();
  }
} // namespace switchboard::plugins
