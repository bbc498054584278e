#ifndef __ETL_PROFILE_H__
#define __ETL_PROFILE_H__

// YAPP engine - ETL profile for hosted targets.
// The core keeps to fixed-capacity ETL containers; the STL stays enabled so
// etl::mutex can map onto std::mutex.

#define ETL_NO_EXCEPTIONS
#define ETL_LOG_ERRORS
#define ETL_VERBOSE_ERRORS
#define ETL_CHECK_PUSH_POP

#endif
