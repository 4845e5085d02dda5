/**
 *  @file
 *  @copyright defined in puzzlevault/LICENSE
 */
#pragma once

#include <boost/multi_index_container.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/ordered_index.hpp>

namespace bmi = boost::multi_index;
using bmi::indexed_by;
using bmi::ordered_unique;
using bmi::member;
using bmi::tag;

struct by_id;
