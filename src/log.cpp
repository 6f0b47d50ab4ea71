// ログ出力先

#include "log.hpp"

namespace rtlsdrusb {

static std::ostream *log = NULL;
static bool isVerbose = false;

void setLog(std::ostream *plog, bool verbose)
{
	log = plog;
	isVerbose = verbose;
}

std::ostream *logOut()
{
	return log;
}

std::ostream *traceOut()
{
	return isVerbose ? log : NULL;
}

}
