#include "DownloadException.h"

namespace RGET{

const char* ErrorKindName(ErrorKind kind)
{
    switch(kind)
    {
    case ErrorKind::Probe:     return "ProbeError";
    case ErrorKind::Transfer:  return "TransferError";
    case ErrorKind::Integrity: return "IntegrityError";
    case ErrorKind::Cancelled: return "CancelledError";
    }
    return "DownloadException";
}

}
