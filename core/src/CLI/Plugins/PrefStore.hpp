/**
 * @file PrefStore.hpp
 * @brief JSON-backed preference groups, one file per group.
 *
 * Values are stored as JSON text so any glaze-serializable type can be kept.
 * Reads are answered from memory when possible; everything touching the disk
 * runs as a task, and disk failures come back as PrefError outputs.
 */

#pragma once

#include <filesystem>   // std::filesystem::path
#include <glaze/json.hpp> // glz::read_json, glz::write_json
#include <variant>      // std::variant

#include <Switchboard/Core/Plugin.hpp>
#include <Switchboard/Runtime/Subscription.hpp>
#include <Switchboard/Runtime/Task.hpp>
#include <Switchboard/Utils/Error.hpp>
#include <Switchboard/Utils/Types.hpp>

namespace switchboard::plugins {
  namespace types = ::switchboard::utils::types;

  using PrefGroup = types::Map<types::String, types::String>;

  namespace pref {
    struct Set {
      types::String group;
      types::String key;
      types::String value; ///< JSON text
    };

    struct Get {
      types::String group;
      types::String key;
    };

    struct Delete {
      types::String group;
      types::String key;
    };

    /// Internal: a Get that had to go to disk.
    struct Loaded {
      types::String                group;
      types::String                key;
      types::Option<types::String> value;
      types::Option<types::String> error;
    };

    /// Internal: a Set finished writing its group file.
    struct Saved {
      types::String                group;
      types::Option<types::String> error;
    };

    /// Internal: a Delete finished rewriting its group file.
    struct Removed {
      types::String                group;
      types::String                key;
      types::u64                   sequence = 0; ///< Write sequence of the Delete.
      bool                         existed  = false;
      types::Option<types::String> error;
    };
  } // namespace pref

  struct PrefMessage {
    std::variant<pref::Set, pref::Get, pref::Delete, pref::Loaded, pref::Saved, pref::Removed> kind;

    /**
     * @brief Store @p value (serialized to JSON) under group/key.
     */
    template <typename T>
    static auto set(types::String group, types::String key, const T& value) -> types::Result<PrefMessage> {
      types::String json;

      if (const auto writeError = glz::write_json(value, json))
        ERR_FMT(utils::error::SwbErrorCode::ParseError, "Failed to serialize '{}/{}': {}", group, key, glz::format_error(writeError, json));

      return PrefMessage { pref::Set { .group = std::move(group), .key = std::move(key), .value = std::move(json) } };
    }

    static auto get(types::String group, types::String key) -> PrefMessage {
      return PrefMessage { pref::Get { .group = std::move(group), .key = std::move(key) } };
    }

    static auto remove(types::String group, types::String key) -> PrefMessage {
      return PrefMessage { pref::Delete { .group = std::move(group), .key = std::move(key) } };
    }
  };

  struct PrefSet {
    types::String group;
    types::String key;
  };

  struct PrefValue {
    types::String group;
    types::String key;
    types::String value; ///< JSON text
  };

  struct PrefNotFound {
    types::String group;
    types::String key;
  };

  struct PrefDeleted {
    types::String group;
    types::String key;
  };

  struct PrefError {
    types::String message;
  };

  struct PrefOutput {
    std::variant<PrefSet, PrefValue, PrefNotFound, PrefDeleted, PrefError> kind;

    /**
     * @brief Deserialize a retrieved value. None for any other output, or if the
     *        stored JSON is not a T.
     */
    template <typename T>
    [[nodiscard]] auto as() const -> types::Option<T> {
      const auto* found = std::get_if<PrefValue>(&kind);

      if (!found)
        return types::None;

      T value {};

      if (glz::read_json(value, found->value))
        return types::None;

      return value;
    }
  };

  /**
   * @brief Shared by the disk tasks of one store.
   *
   * Writes to the same key may finish out of order; a write older than the
   * newest one already on disk is skipped.
   */
  struct PrefFiles {
    types::Mutex                                   mutex; ///< Serializes read-modify-write cycles on group files.
    types::UnorderedMap<types::String, types::u64> newest; ///< Sequence of the last write per "group/key".
  };

  struct PrefStoreState {
    types::Map<types::String, PrefGroup>   cache;
    std::filesystem::path                  directory;
    types::SharedPointer<PrefFiles>        files;
    types::u64                             writeSequence = 0;
    types::Map<types::String, types::u64>  tombstones; ///< "group/key" of Deletes not yet on disk, with their sequence.

    [[nodiscard]] auto groupPath(types::StringView group) const -> std::filesystem::path;
  };

  /**
   * @brief Read a group file. A missing or empty file is an empty group.
   */
  auto LoadGroup(const std::filesystem::path& path) -> types::Result<PrefGroup>;

  /**
   * @brief Write a group file, creating its directory if needed.
   */
  auto SaveGroup(const std::filesystem::path& path, const PrefGroup& group) -> types::Result<>;

  class PrefStorePlugin {
   public:
    using Message = PrefMessage;
    using State   = PrefStoreState;
    using Output  = PrefOutput;

    explicit PrefStorePlugin(std::filesystem::path directory)
      : m_directory(std::move(directory)) {}

    [[nodiscard]] auto name() const -> types::StringView {
      return "pref_store";
    }

    [[nodiscard]] auto directory() const -> const std::filesystem::path& {
      return m_directory;
    }

    [[nodiscard]] auto init() const -> types::Pair<State, core::runtime::Task<Message>>;

    auto update(State& state, Message message) const -> core::plugin::UpdateResult<Message, Output>;

    [[nodiscard]] auto subscription(const State& state) const -> core::runtime::Subscription<Message>;

   private:
    std::filesystem::path m_directory;
  };
} // namespace switchboard::plugins
