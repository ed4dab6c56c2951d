/**
 * @file genre_source.h
 * @brief External genre metadata provider interface
 */

#pragma once

#include <string>

#include "store/genre_cache.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace tastemix::genres {

/**
 * @brief One external genre provider
 *
 * Implementations are consulted in a fixed priority order by GenreResolver.
 * An empty GenreSet means the provider knows nothing about the artist; an
 * error means the provider could not be asked. Both make the resolver move
 * on to the next source.
 */
class GenreSource {
 public:
  virtual ~GenreSource() = default;

  /**
   * @brief Provider name for logs
   */
  virtual const std::string& Name() const = 0;

  /**
   * @brief Look up genre tags for an artist
   *
   * @param artist Artist display name
   * @return Genre tags (possibly empty) or kGenreSourceFailed /
   *         kGenreSourceInvalidResponse / kTimeout
   */
  virtual utils::Expected<store::GenreSet, utils::Error> Lookup(const std::string& artist) = 0;
};

}  // namespace tastemix::genres
