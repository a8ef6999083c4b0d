/**
 * @file session.h
 * @brief Caller-owned MongoDB session with read preference and write concern
 */

#pragma once

#include <mongocxx/client.hpp>
#include <mongocxx/database.hpp>
#include <mongocxx/pool.hpp>

#include <memory>
#include <string>

#include "config/config.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace mongokit::mongo {

/**
 * @brief Build the connection URI for a session configuration
 *
 * - "host:port[,host:port]" gets a "mongodb://" scheme
 * - "/database" is appended when the servers string has no path
 * - readPreference, w, journal, wtimeoutMS, appname, connectTimeoutMS and
 *   serverSelectionTimeoutMS are added unless the servers string already
 *   sets them
 *
 * @param config Session configuration
 * @return Connection URI
 */
std::string BuildConnectionUri(const config::MongoConfig& config);

/**
 * @brief MongoDB session
 *
 * Owns a driver connection pool configured from MongoConfig. Connections
 * are checked out per unit of work with Acquire(); the pool itself is
 * managed by the driver.
 *
 * Connect() and Close() are not synchronized. Acquire() may be called from
 * several threads once connected.
 */
class Session {
 public:
  /**
   * @brief Construct session (not yet connected)
   */
  explicit Session(config::MongoConfig config);

  /**
   * @brief Destructor - closes the pool if open
   */
  ~Session();

  // Non-copyable
  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  // Movable
  Session(Session&& other) noexcept;
  Session& operator=(Session&& other) noexcept;

  /**
   * @brief Create the pool and verify the deployment answers a ping
   * @param context Optional context label for logging (e.g., "main", "worker")
   * @return Expected<void, Error> - kMongoInvalidUri or kMongoConnectionFailed on failure
   */
  mongokit::utils::Expected<void, mongokit::utils::Error> Connect(const std::string& context = "");

  /**
   * @brief Check if Connect() succeeded and Close() was not called since
   */
  [[nodiscard]] bool IsConnected() const { return pool_ != nullptr; }

  /**
   * @brief Run the ping command on a pooled connection
   */
  mongokit::utils::Expected<void, mongokit::utils::Error> Ping();

  /**
   * @brief Release the pool
   */
  void Close();

  /**
   * @brief Check out a client from the pool
   *
   * The client returns to the pool when the entry is destroyed.
   *
   * @return Pooled client, or kMongoNotConnected
   */
  mongokit::utils::Expected<mongocxx::pool::entry, mongokit::utils::Error> Acquire();

  /**
   * @brief Configured database on a checked-out client
   */
  [[nodiscard]] mongocxx::database Database(mongocxx::client& client) const { return client[DatabaseName()]; }

  /**
   * @brief Database named by the connection URI
   *
   * A path in mongo.servers wins over mongo.database, as in BuildConnectionUri().
   * Falls back to "admin" when neither names one.
   */
  [[nodiscard]] std::string DatabaseName() const;

  [[nodiscard]] const config::MongoConfig& GetConfig() const { return config_; }

 private:
  config::MongoConfig config_;
  std::unique_ptr<mongocxx::pool> pool_;
};

}  // namespace mongokit::mongo
