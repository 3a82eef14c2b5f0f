// AvatarRig viewer
// Loads one avatar, drives it from the keyboard and writes TPJ diagnostics.
// Keys:
//   W/A/S/D or arrows: Move
//   Shift: Run
//   ESC: Quit

#include <irrlicht.h>
#include <json/json.h>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include "avr/common/logging.h"
#include "avr/animation/root_motion_stripper.h"
#include "avr/avatar/avatar_config.h"
#include "avr/avatar/instance_registry.h"
#include "avr/diagnostics/diagnostic_log_sink.h"
#include "avr/graphics/avatar_controller.h"
#include "avr/graphics/avatar_loader.h"
#include "avr/graphics/keyboard_event_receiver.h"
#include "avr/graphics/model_normalizer.h"
#include "avr/state/event_bus.h"

using namespace irr;

#ifndef _WIN32
void HandleSigUsr1(int /*sig*/) {
	LogLevelIncrease();
}

void HandleSigUsr2(int /*sig*/) {
	LogLevelDecrease();
}
#endif

// Applies the optional "logging" section of the config file
static void LoadLoggingSection(const std::string& path) {
	std::ifstream file(path);
	if (!file.is_open()) {
		return;
	}
	Json::Value root;
	Json::CharReaderBuilder builder;
	std::string errors;
	if (Json::parseFromStream(builder, file, &root, &errors)) {
		InitLoggingFromJson(root);
	}
}

static void PrintUsage(const char* program) {
	std::cout << "Usage: " << program << " [options]\n";
	std::cout << "Options:\n";
	std::cout << "  -c, --config <file>      Avatar config (default: data/config/avatar.json)\n";
	std::cout << "  -a, --avatar <name>      Avatar to load (default: avatar)\n";
	std::cout << "  --asset-dir <dir>        Directory holding avatar meshes (default: data/avatars)\n";
	std::cout << "  --diag-log <file>        Write TPJ diagnostics to a file instead of stdout\n";
	std::cout << "  --save-config <file>     Write the effective config as JSON and exit\n";
	std::cout << "  -r, --resolution <W> <H> Window size (default: 1024 768)\n";
	std::cout << "  --opengl                 Use OpenGL (default: software)\n";
	std::cout << "  --log-level=LEVEL        Set log level (NONE, FATAL, ERROR, WARN, INFO, DEBUG, TRACE)\n";
	std::cout << "  --log-module=MOD:LEVEL   Set per-module log level (e.g., ANIMATION:TRACE)\n";
	std::cout << "                           Modules: MOVEMENT, INPUT, ANIMATION, NORMALIZE, SYNC,\n";
	std::cout << "                                    INSTANCE, ASSET, CONFIG, DIAG, MAIN\n";
#ifndef _WIN32
	std::cout << "  Signal SIGUSR1           Increase log level at runtime\n";
	std::cout << "  Signal SIGUSR2           Decrease log level at runtime\n";
#endif
	std::cout << "  -h, --help               Show this help message\n";
}

int main(int argc, char* argv[]) {
	std::string configPath;
	std::string avatarName = "avatar";
	std::string assetDir = "data/avatars";
	std::string diagLogPath;
	std::string saveConfigPath;
	u32 width = 1024;
	u32 height = 768;
	bool useOpenGL = false;

	for (int i = 1; i < argc; i++) {
		std::string arg = argv[i];
		if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
			configPath = argv[++i];
		} else if ((arg == "-a" || arg == "--avatar") && i + 1 < argc) {
			avatarName = argv[++i];
		} else if (arg == "--asset-dir" && i + 1 < argc) {
			assetDir = argv[++i];
		} else if (arg == "--diag-log" && i + 1 < argc) {
			diagLogPath = argv[++i];
		} else if (arg == "--save-config" && i + 1 < argc) {
			saveConfigPath = argv[++i];
		} else if ((arg == "-r" || arg == "--resolution") && i + 2 < argc) {
			width = static_cast<u32>(std::atoi(argv[++i]));
			height = static_cast<u32>(std::atoi(argv[++i]));
		} else if (arg == "--opengl") {
			useOpenGL = true;
		} else if (arg == "--help" || arg == "-h") {
			PrintUsage(argv[0]);
			return 0;
		}
	}

	InitLogging(argc, argv);

#ifndef _WIN32
	signal(SIGUSR1, HandleSigUsr1);
	signal(SIGUSR2, HandleSigUsr2);
#endif

	avr::avatar::AvatarConfig config;
	if (!avr::avatar::AvatarConfigLoader::loadConfig(config, configPath, avatarName)) {
		LOG_WARN(MOD_CONFIG, "Config could not be fully loaded, continuing with defaults where missing");
	}
	if (!configPath.empty()) {
		LoadLoggingSection(configPath);
	}

	if (!saveConfigPath.empty()) {
		return avr::avatar::AvatarConfigLoader::saveToFile(saveConfigPath, config) ? 0 : 1;
	}

	LOG_INFO(MOD_MAIN, "Starting AvatarRig viewer: avatar={} assets={}", avatarName, assetDir);
	LOG_INFO(MOD_MAIN, "Log level: {} (use --log-level=LEVEL to change)", GetLevelName(static_cast<LogLevel>(GetLogLevel())));

	std::ofstream diagFile;
	if (!diagLogPath.empty()) {
		diagFile.open(diagLogPath, std::ios::out | std::ios::app);
		if (!diagFile.is_open()) {
			LOG_ERROR(MOD_DIAG, "Could not open diagnostics log {}, using stdout", diagLogPath);
		}
	}
	std::ostream& diagOut = diagFile.is_open() ? static_cast<std::ostream&>(diagFile) : std::cout;

	avr::state::EventBus eventBus;
	avr::diagnostics::DiagnosticLogSink diagnostics(eventBus, diagOut);

	avr::graphics::KeyboardEventReceiver receiver;

	SIrrlichtCreationParameters params;
	params.DriverType = useOpenGL ? video::EDT_OPENGL : video::EDT_BURNINGSVIDEO;
	params.WindowSize = core::dimension2d<u32>(width, height);
	params.EventReceiver = &receiver;

	IrrlichtDevice* device = createDeviceEx(params);
	if (!device) {
		LOG_FATAL(MOD_MAIN, "Failed to create Irrlicht device");
		return 1;
	}
	device->setWindowCaption(L"AvatarRig");

	video::IVideoDriver* driver = device->getVideoDriver();
	scene::ISceneManager* smgr = device->getSceneManager();

	scene::ISceneNode* world = smgr->addEmptySceneNode();
	world->setName("World");

	scene::IMesh* groundMesh = smgr->getGeometryCreator()->createPlaneMesh(
		core::dimension2d<f32>(1.0f, 1.0f), core::dimension2d<u32>(40, 40));
	if (groundMesh) {
		scene::IMeshSceneNode* ground = smgr->addMeshSceneNode(groundMesh, world);
		ground->setMaterialFlag(video::EMF_LIGHTING, false);
		ground->setMaterialFlag(video::EMF_WIREFRAME, true);
		groundMesh->drop();
	}
	smgr->setAmbientLight(video::SColorf(0.6f, 0.6f, 0.6f));
	smgr->addLightSceneNode(nullptr, core::vector3df(5, 10, 5), video::SColorf(1.0f, 1.0f, 1.0f), 30.0f);

	scene::ICameraSceneNode* camera = smgr->addCameraSceneNode(
		nullptr, core::vector3df(0, 2.5f, 4.5f), core::vector3df(0, 1, 0));
	camera->setNearValue(0.05f);

	avr::avatar::InstanceRegistry registry(&eventBus);
	avr::graphics::ModelNormalizer normalizer(smgr, &eventBus);
	avr::animation::RootMotionStripper stripper(&eventBus);
	avr::graphics::AvatarLoader loader(smgr, assetDir);

	avr::graphics::ControllerContext context;
	context.smgr = smgr;
	context.registry = &registry;
	context.normalizer = &normalizer;
	context.stripper = &stripper;
	context.eventBus = &eventBus;

	{
		avr::graphics::AvatarController controller(avatarName, loader.load(avatarName), config, context);
		receiver.setTarget(&controller);
		controller.attach(world);

		u32 lastTime = device->getTimer()->getTime();
		while (device->run()) {
			u32 currentTime = device->getTimer()->getTime();
			float deltaSeconds = (currentTime - lastTime) / 1000.0f;
			lastTime = currentTime;

			receiver.updateFocus(device->isWindowActive());
			if (receiver.quitRequested()) {
				device->closeDevice();
				break;
			}

			if (controller.getState() == avr::graphics::ControllerState::Unattached &&
				controller.lastError() == avr::AvatarError::MissingSceneNode) {
				controller.attach(world);
			}

			avr::state::MovementState movement = controller.tick(deltaSeconds);

			// Follow camera behind the avatar
			core::vector3df avatarPos(movement.position.x, movement.position.y, movement.position.z);
			camera->setPosition(avatarPos + core::vector3df(0, 2.5f, 4.5f));
			camera->setTarget(avatarPos + core::vector3df(0, 1.0f, 0));

			driver->beginScene(true, true, video::SColor(255, 40, 44, 52));
			smgr->drawAll();
			driver->endScene();
		}

		receiver.setTarget(nullptr);
	}

	loader.clear();
	device->drop();
	LOG_INFO(MOD_MAIN, "AvatarRig viewer exiting");
	return 0;
}
