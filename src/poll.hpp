// 有限回ポーリング

#ifndef _RTLSDRUSB_POLL_HPP_
#define _RTLSDRUSB_POLL_HPP_

#include <boost/function.hpp>
#include <boost/system/error_code.hpp>
#include <boost/thread/thread.hpp>
#include <boost/chrono/duration.hpp>

#include "error.hpp"

namespace rtlsdrusb {

struct PollPolicy {
	unsigned maxAttempts;
	unsigned delayMs;	// sleep between attempts, not after the last one
};

// One attempt. Sets done when the awaited condition holds. A returned error
// aborts the loop immediately.
typedef boost::function<boost::system::error_code (unsigned attempt, bool &done)> PollStep;

inline boost::system::error_code
pollUntil(const PollPolicy &policy, const PollStep &step, error::errc exhausted)
{
	for (unsigned i = 0; i < policy.maxAttempts; i++) {
		bool done = false;
		boost::system::error_code ec = step(i, done);
		if (ec)
			return ec;
		if (done)
			return boost::system::error_code();
		if (policy.delayMs && i + 1 < policy.maxAttempts)
			boost::this_thread::sleep_for(boost::chrono::milliseconds(policy.delayMs));
	}
	return error::make_error_code(exhausted);
}

}

#endif
