#include "deploy_wrapper/Deployment.hpp"

namespace deploywrap {

	bool operator==(const DeploymentDecision& a, const DeploymentDecision& b)
	{
		return a.deploymentType == b.deploymentType && a.deployMode == b.deployMode;
	}

	bool operator!=(const DeploymentDecision& a, const DeploymentDecision& b)
	{
		return !(a == b);
	}

	//------------------------------------------------------------
	//	Значение параметра -DeploymentType
	//------------------------------------------------------------
	const char* toString(DeploymentType t)
	{
		switch (t)
		{
		case DeploymentType::Install:	return "Install";
		case DeploymentType::Uninstall:	return "Uninstall";
		}
		return "Install";
	}
	//------------------------------------------------------------
	//	Значение параметра -DeployMode
	//------------------------------------------------------------
	const char* toString(DeployMode m)
	{
		switch (m)
		{
		case DeployMode::Interactive:	return "Interactive";
		case DeployMode::Silent:		return "Silent";
		}
		return "Silent";
	}

}; //---namespace deploywrap
