/**
 * @file mongo_instance.h
 * @brief Process-wide MongoDB driver instance
 */

#pragma once

#include <mongocxx/instance.hpp>

namespace mongokit::mongo {

/**
 * @brief Get the driver instance, creating it on first use
 *
 * The driver allows exactly one instance per process and it must outlive
 * every client, so it is never destroyed before exit.
 */
mongocxx::instance& GetMongoInstance();

}  // namespace mongokit::mongo
