#include "deploy_wrapper/Platform.hpp"
#include "deploy_wrapper/IProcessInspector.hpp"
#include "platform/PlatformImpl.hpp"

namespace deploywrap {
	//------------------------------------------------------------
	//	Создание инспектора процессов для текущей платформы
	//------------------------------------------------------------
	std::unique_ptr<IProcessInspector> makeProcessInspector() {
		return platform::makeProcessInspector();
	}
}; //---namespace deploywrap
